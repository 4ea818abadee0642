#include <test/test_only.h>
#include <UtxoListingCalculator.h>
#include <AddressDirectory.h>
#include <FeeRate.h>
#include <MassCalculator.h>
#include <PendingLedger.h>
#include <SignatureMassEstimator.h>
#include <UtxoSnapshotBuilder.h>
#include <UtxoStore.h>
#include <defaultValues.h>
#include <test/FakeAddressEncoder.h>
#include <test/PendingTransactionFactory.h>
#include <test/WalletUtxoGenerator.h>

class UtxoListingCalculatorTestFixture
{
public:
    WalletUtxoGenerator utxoGenerator;
    FakeAddressEncoder addressEncoder;
    AddressDirectory directory;
    SchnorrSignatureMassEstimator signatureMassEstimator;
    MassCalculator massCalculator;
    UtxoStore store;
    PendingLedger ledger;
    UtxoListingCalculator calculator;
    WalletAddress firstOwner;
    WalletAddress secondOwner;
    const CFeeRate feeRate;

    UtxoListingCalculatorTestFixture(
        ): utxoGenerator()
        , addressEncoder()
        , directory(addressEncoder)
        , signatureMassEstimator()
        , massCalculator(signatureMassEstimator)
        , store()
        , ledger()
        , calculator(directory, massCalculator, DEFAULT_COINBASE_MATURITY)
        , firstOwner(0u, 0u, Keychain::EXTERNAL)
        , secondOwner(1u, 0u, Keychain::EXTERNAL)
        , feeRate(1000)
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

    std::vector<AddressUtxos> list(const std::vector<std::string>& filter, bool includePending, bool includeDust) const
    {
        return calculator.ListUtxos(store.overlay(ledger), feeRate, filter, includePending, includeDust);
    }
};

BOOST_FIXTURE_TEST_SUITE(UtxoListingCalculatorTests, UtxoListingCalculatorTestFixture)

BOOST_AUTO_TEST_CASE(anEmptyWalletListsNothing)
{
    BOOST_CHECK(list(std::vector<std::string>(), true, true).empty());
}

BOOST_AUTO_TEST_CASE(utxosAreGroupedByAddressAndOrderedByAmount)
{
    publish({
        utxoGenerator(30000, secondOwner),
        utxoGenerator(50000, firstOwner),
        utxoGenerator(20000, firstOwner)});
    const std::vector<AddressUtxos> listing = list(std::vector<std::string>(), false, false);
    BOOST_REQUIRE_EQUAL(listing.size(), 2u);
    BOOST_CHECK_EQUAL(listing[0].address, addressEncoder.EncodeAddress(firstOwner));
    BOOST_REQUIRE_EQUAL(listing[0].utxos.size(), 2u);
    BOOST_CHECK_EQUAL(listing[0].utxos[0].utxo.amount(), 20000);
    BOOST_CHECK_EQUAL(listing[0].utxos[1].utxo.amount(), 50000);
    BOOST_CHECK_EQUAL(listing[1].utxos.size(), 1u);
}

BOOST_AUTO_TEST_CASE(dustIsWorthLessThanTheFeeToSpendIt)
{
    publish({utxoGenerator(1117, firstOwner), utxoGenerator(1118, firstOwner)});
    const std::vector<AddressUtxos> withoutDust = list(std::vector<std::string>(), false, false);
    BOOST_REQUIRE_EQUAL(withoutDust.size(), 1u);
    BOOST_REQUIRE_EQUAL(withoutDust[0].utxos.size(), 1u);
    BOOST_CHECK_EQUAL(withoutDust[0].utxos[0].utxo.amount(), 1118);

    const std::vector<AddressUtxos> withDust = list(std::vector<std::string>(), false, true);
    BOOST_REQUIRE_EQUAL(withDust[0].utxos.size(), 2u);
    BOOST_CHECK(withDust[0].utxos[0].isDust);
    BOOST_CHECK(!withDust[0].utxos[1].isDust);
}

BOOST_AUTO_TEST_CASE(pendingOutputsAreListedOnlyOnRequest)
{
    const WalletUtxo spent = utxoGenerator(100000, firstOwner);
    publish({spent, utxoGenerator(9000, secondOwner, true, 4800u)});
    std::vector<CTxOut> outputs(1u, CTxOut(90000, ScriptPublicKey()));
    std::map<unsigned, WalletAddress> ownedOutputs;
    ownedOutputs.insert(std::make_pair(0u, firstOwner));
    ledger.add(CreatePendingTransaction(std::vector<WalletUtxo>(1u, spent), outputs, ownedOutputs));

    BOOST_CHECK(list(std::vector<std::string>(), false, true).empty());

    const std::vector<AddressUtxos> listing = list(std::vector<std::string>(), true, true);
    BOOST_REQUIRE_EQUAL(listing.size(), 2u);
    for (const AddressUtxos& addressUtxos: listing)
    {
        BOOST_REQUIRE_EQUAL(addressUtxos.utxos.size(), 1u);
        BOOST_CHECK(addressUtxos.utxos[0].isPending);
        BOOST_CHECK(addressUtxos.utxos[0].utxo.outpoint() != spent.outpoint());
    }
}

BOOST_AUTO_TEST_CASE(theFilterKeepsOnlyTheRequestedAddresses)
{
    publish({utxoGenerator(30000, secondOwner), utxoGenerator(50000, firstOwner)});
    const std::string wanted = addressEncoder.EncodeAddress(secondOwner);
    const std::vector<AddressUtxos> listing = list(std::vector<std::string>(1u, wanted), false, false);
    BOOST_REQUIRE_EQUAL(listing.size(), 1u);
    BOOST_CHECK_EQUAL(listing[0].address, wanted);
}

BOOST_AUTO_TEST_SUITE_END()
