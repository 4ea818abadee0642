#include <test/test_only.h>
#include <WalletModule.h>
#include <AddressDirectory.h>
#include <PendingLedger.h>
#include <Settings.h>
#include <SyncEngine.h>
#include <defaultValues.h>
#include <test/FakeAddressEncoder.h>
#include <test/MockNodeClient.h>
#include <test/WalletUtxoGenerator.h>

#include <memory>
#include <stdexcept>

using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class WalletModuleTestFixture
{
public:
    WalletUtxoGenerator utxoGenerator;
    CopyableSettings settings;
    FakeAddressEncoder addressEncoder;
    AddressDirectory directory;
    NiceMock<MockNodeClient> nodeClient;
    std::vector<RpcUtxoEntry> consensusEntries;
    WalletAddress owner;

    WalletModuleTestFixture(
        ): utxoGenerator()
        , settings()
        , addressEncoder()
        , directory(addressEncoder)
        , nodeClient()
        , consensusEntries()
        , owner(0u, 0u, Keychain::EXTERNAL)
    {
        directory.AddAddress(owner);
        ON_CALL(nodeClient, GetUtxosByAddresses(_, _, _)).WillByDefault(Invoke(
            [this](const std::vector<std::string>&, std::vector<RpcUtxoEntry>& entries, std::string&)
            {
                entries = consensusEntries;
                return true;
            }));
        ON_CALL(nodeClient, GetMempoolEntriesByAddresses(_, _, _)).WillByDefault(Return(true));
        ON_CALL(nodeClient, GetVirtualDaaScore(_, _)).WillByDefault(DoAll(SetArgReferee<0>(uint64_t(5000u)), Return(true)));
        ON_CALL(nodeClient, GetFeeEstimate(_, _)).WillByDefault(DoAll(SetArgReferee<0>(1.0), Return(true)));
        ON_CALL(nodeClient, SubmitTransaction(_, _, _)).WillByDefault(Invoke(
            [](const CTransaction& transaction, uint256& transactionId, std::string&)
            {
                transactionId = transaction.GetHash();
                return true;
            }));
    }

    std::unique_ptr<WalletModule> createModule(unsigned cosignerCount = 1u)
    {
        return std::unique_ptr<WalletModule>(new WalletModule(settings, directory, addressEncoder, nodeClient, cosignerCount));
    }

    void addConsensusUtxo(CAmount amount)
    {
        const WalletUtxo utxo = utxoGenerator(amount, owner);
        RpcUtxoEntry entry;
        entry.address = addressEncoder.EncodeAddress(owner);
        entry.outpoint = utxo.outpoint();
        entry.utxoEntry = utxo.utxoEntry();
        consensusEntries.push_back(entry);
    }
};

BOOST_FIXTURE_TEST_SUITE(WalletModuleTests, WalletModuleTestFixture)

BOOST_AUTO_TEST_CASE(anUnknownSignatureSchemeIsAConfigurationError)
{
    settings.SetParameter("-signaturescheme", "bls");
    BOOST_CHECK_THROW(createModule(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(moreRequiredSignaturesThanCosignersIsAConfigurationError)
{
    settings.SetParameter("-minimumsignatures", "3");
    BOOST_CHECK_THROW(createModule(2u), std::runtime_error);
    settings.SetParameter("-minimumsignatures", "2");
    BOOST_CHECK_NO_THROW(createModule(2u));
}

BOOST_AUTO_TEST_CASE(negativeIntervalsAreAConfigurationError)
{
    settings.SetParameter("-syncinterval", "-1");
    BOOST_CHECK_THROW(createModule(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(requestsAreRefusedUntilTheFirstSync)
{
    addConsensusUtxo(10 * SOMPI_PER_KASPA);
    std::unique_ptr<WalletModule> module = createModule();
    BOOST_CHECK(!module->IsSynced());

    WalletBalances balances;
    std::string errorMessage;
    BOOST_CHECK(!module->GetBalances(false, balances, errorMessage));
    BOOST_CHECK(!errorMessage.empty());

    std::vector<AddressUtxos> listing;
    BOOST_CHECK(!module->ListUtxos(std::vector<std::string>(), true, true, listing, errorMessage));

    TransactionBuildRequest request;
    request.toAddress = FakeAddressEncoder::prefix + "recipient";
    request.amount = SOMPI_PER_KASPA;
    BOOST_CHECK(module->CreateUnsignedTransactions(request).errorKind == WalletErrorKind::NOT_SYNCED);

    BOOST_REQUIRE(module->syncEngine().RunSyncCycle() == SyncCycleResult::SYNCED);
    BOOST_CHECK(module->IsSynced());
    BOOST_CHECK(module->GetBalances(false, balances, errorMessage));
    BOOST_CHECK_EQUAL(balances.available, 10 * SOMPI_PER_KASPA);
    BOOST_CHECK(module->ListUtxos(std::vector<std::string>(), true, true, listing, errorMessage));
    BOOST_CHECK_EQUAL(listing.size(), 1u);
}

BOOST_AUTO_TEST_CASE(aSubmittedPaymentIsReflectedUntilItConfirms)
{
    addConsensusUtxo(10 * SOMPI_PER_KASPA);
    addConsensusUtxo(30 * SOMPI_PER_KASPA);
    std::unique_ptr<WalletModule> module = createModule();
    BOOST_REQUIRE(module->syncEngine().RunSyncCycle() == SyncCycleResult::SYNCED);

    TransactionBuildRequest request;
    request.toAddress = FakeAddressEncoder::prefix + "recipient";
    request.amount = 5 * SOMPI_PER_KASPA;
    const TransactionBuildResult built = module->CreateUnsignedTransactions(request);
    BOOST_REQUIRE(built.succeeded());
    BOOST_CHECK_EQUAL(module->pendingLedger().size(), 0u);

    const TransactionSubmissionResult submitted = module->SubmitTransactions(built.transactions);
    BOOST_REQUIRE(submitted.succeeded());
    BOOST_CHECK_EQUAL(module->pendingLedger().size(), 1u);

    WalletBalances balances;
    std::string errorMessage;
    BOOST_REQUIRE(module->GetBalances(false, balances, errorMessage));
    BOOST_CHECK_EQUAL(balances.available, 0);
    BOOST_CHECK_EQUAL(balances.pending, built.changeAmount);

    consensusEntries.clear();
    BOOST_REQUIRE(module->syncEngine().RunSyncCycle() == SyncCycleResult::SYNCED);
    BOOST_CHECK_EQUAL(module->pendingLedger().size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
