#include <test/test_only.h>
#include <WalletBalanceCalculator.h>
#include <AddressDirectory.h>
#include <PendingLedger.h>
#include <UtxoSnapshotBuilder.h>
#include <UtxoStore.h>
#include <defaultValues.h>
#include <test/FakeAddressEncoder.h>
#include <test/PendingTransactionFactory.h>
#include <test/WalletUtxoGenerator.h>

class WalletBalanceCalculatorTestFixture
{
public:
    WalletUtxoGenerator utxoGenerator;
    FakeAddressEncoder addressEncoder;
    AddressDirectory directory;
    UtxoStore store;
    PendingLedger ledger;
    WalletBalanceCalculator calculator;
    WalletAddress firstOwner;
    WalletAddress secondOwner;

    WalletBalanceCalculatorTestFixture(
        ): utxoGenerator()
        , addressEncoder()
        , directory(addressEncoder)
        , store()
        , ledger()
        , calculator(directory, DEFAULT_COINBASE_MATURITY)
        , firstOwner(0u, 0u, Keychain::EXTERNAL)
        , secondOwner(1u, 0u, Keychain::EXTERNAL)
    {
        directory.AddAddress(firstOwner);
        directory.AddAddress(secondOwner);
    }

    void publish(const std::vector<WalletUtxo>& utxos)
    {
        UtxoSnapshotBuilder builder;
        for (const WalletUtxo& utxo: utxos)
        {
            builder.AddUtxo(utxo);
        }
        store.publish(builder.Build(1u, 5000u));
    }
};

BOOST_FIXTURE_TEST_SUITE(WalletBalanceCalculatorTests, WalletBalanceCalculatorTestFixture)

BOOST_AUTO_TEST_CASE(anEmptyWalletHasNoBalance)
{
    const WalletBalances balances = calculator.CalculateBalances(store.overlay(ledger), true);
    BOOST_CHECK_EQUAL(balances.available, 0);
    BOOST_CHECK_EQUAL(balances.pending, 0);
    BOOST_CHECK(balances.addressBalances.empty());
}

BOOST_AUTO_TEST_CASE(matureOutputsAreAvailable)
{
    publish({utxoGenerator(10, firstOwner), utxoGenerator(20, secondOwner), utxoGenerator(30, firstOwner, true, 1000u)});
    const WalletBalances balances = calculator.CalculateBalances(store.overlay(ledger), false);
    BOOST_CHECK_EQUAL(balances.available, 60);
    BOOST_CHECK_EQUAL(balances.pending, 0);
    BOOST_CHECK(balances.addressBalances.empty());
}

BOOST_AUTO_TEST_CASE(immatureCoinbaseOutputsArePending)
{
    publish({utxoGenerator(10, firstOwner), utxoGenerator(40, firstOwner, true, 4500u)});
    const WalletBalances balances = calculator.CalculateBalances(store.overlay(ledger), false);
    BOOST_CHECK_EQUAL(balances.available, 10);
    BOOST_CHECK_EQUAL(balances.pending, 40);
}

BOOST_AUTO_TEST_CASE(pendingSpendsLeaveAndPendingChangeArrives)
{
    const WalletUtxo spent = utxoGenerator(100, firstOwner);
    publish({spent, utxoGenerator(20, secondOwner)});
    std::vector<CTxOut> outputs;
    outputs.emplace_back(30, ScriptPublicKey());
    outputs.emplace_back(65, ScriptPublicKey());
    std::map<unsigned, WalletAddress> ownedOutputs;
    ownedOutputs.insert(std::make_pair(1u, secondOwner));
    ledger.add(CreatePendingTransaction(std::vector<WalletUtxo>(1u, spent), outputs, ownedOutputs));

    const WalletBalances balances = calculator.CalculateBalances(store.overlay(ledger), true);
    BOOST_CHECK_EQUAL(balances.available, 20);
    BOOST_CHECK_EQUAL(balances.pending, 65);
    BOOST_REQUIRE_EQUAL(balances.addressBalances.size(), 1u);
    BOOST_CHECK_EQUAL(balances.addressBalances[0].address, addressEncoder.EncodeAddress(secondOwner));
    BOOST_CHECK_EQUAL(balances.addressBalances[0].available, 20);
    BOOST_CHECK_EQUAL(balances.addressBalances[0].pending, 65);
}

BOOST_AUTO_TEST_CASE(perAddressBalancesAreOrderedByAddressAndSumToTheTotal)
{
    publish({
        utxoGenerator(10, secondOwner),
        utxoGenerator(15, firstOwner),
        utxoGenerator(5, secondOwner),
        utxoGenerator(7, firstOwner, true, 4900u)});
    const WalletBalances balances = calculator.CalculateBalances(store.overlay(ledger), true);
    BOOST_REQUIRE_EQUAL(balances.addressBalances.size(), 2u);
    BOOST_CHECK(balances.addressBalances[0].address < balances.addressBalances[1].address);

    CAmount available = 0;
    CAmount pending = 0;
    for (const AddressBalance& addressBalance: balances.addressBalances)
    {
        available += addressBalance.available;
        pending += addressBalance.pending;
    }
    BOOST_CHECK_EQUAL(available, balances.available);
    BOOST_CHECK_EQUAL(pending, balances.pending);
    BOOST_CHECK_EQUAL(balances.available, 30);
    BOOST_CHECK_EQUAL(balances.pending, 7);
}

BOOST_AUTO_TEST_SUITE_END()
