#include <WalletModule.h>

#include <DustCalculator.h>
#include <FeePolicy.h>
#include <Logging.h>
#include <MassCalculator.h>
#include <OverlayUtxoView.h>
#include <PendingLedger.h>
#include <Settings.h>
#include <SignatureMassEstimator.h>
#include <SyncEngine.h>
#include <ThreadManagementHelpers.h>
#include <UtxoSelector.h>
#include <UtxoStore.h>
#include <defaultValues.h>

#include <stdexcept>

#include <boost/bind.hpp>
#include <boost/function.hpp>
#include <boost/thread.hpp>

namespace
{
int64_t GetNonNegativeArg(const CopyableSettings& settings, const std::string& name, int64_t defaultValue)
{
    const int64_t value = settings.GetArg(name, defaultValue);
    if (value < 0)
        throw std::runtime_error(tfm::format("%s must not be negative, got %d", name, value));
    return value;
}

std::unique_ptr<I_SignatureMassEstimator> CreateConfiguredEstimator(
    const CopyableSettings& settings,
    unsigned cosignerCount)
{
    const std::string scheme = settings.GetArg("-signaturescheme", "schnorr");
    const int64_t minimumSignatures = settings.GetArg("-minimumsignatures", 1);
    if (minimumSignatures < 1 || static_cast<uint64_t>(minimumSignatures) > cosignerCount)
        throw std::runtime_error(tfm::format("-minimumsignatures=%d is invalid for %u cosigners", minimumSignatures, cosignerCount));
    std::unique_ptr<I_SignatureMassEstimator> estimator =
        CreateSignatureMassEstimator(scheme, static_cast<unsigned>(minimumSignatures), cosignerCount);
    if (!estimator)
        throw std::runtime_error(tfm::format("Unknown -signaturescheme=%s", scheme));
    return estimator;
}
} // anonymous namespace

WalletModule::WalletModule(
    const CopyableSettings& settings,
    I_AddressDirectory& addressDirectory,
    const I_AddressEncoder& addressEncoder,
    const I_NodeClient& nodeClient,
    unsigned cosignerCount
    ): coinbaseMaturity_(GetNonNegativeArg(settings, "-coinbasematurity", DEFAULT_COINBASE_MATURITY))
    , syncIntervalMillis_(GetNonNegativeArg(settings, "-syncinterval", DEFAULT_SYNC_INTERVAL) * 1000)
    , signatureMassEstimator_(CreateConfiguredEstimator(settings, cosignerCount))
    , massCalculator_(new MassCalculator(*signatureMassEstimator_))
    , dustCalculator_(new DustCalculator(*massCalculator_))
    , feePolicyResolver_(new FeePolicyResolver(nodeClient, GetNonNegativeArg(settings, "-maxfee", DEFAULT_TRANSACTION_MAXFEE)))
    , utxoSelector_(new UtxoSelector(*massCalculator_, coinbaseMaturity_, MINIMUM_CHANGE_TARGET))
    , utxoStore_(new UtxoStore())
    , pendingLedger_(new PendingLedger())
    , syncEngine_(new SyncEngine(addressDirectory, nodeClient, *utxoStore_, *pendingLedger_))
    , transactionBuilder_(
        new TransactionBuilder(
            addressDirectory,
            addressEncoder,
            *utxoStore_,
            *pendingLedger_,
            *feePolicyResolver_,
            *massCalculator_,
            *dustCalculator_,
            *utxoSelector_))
    , transactionSubmitter_(new TransactionSubmitter(nodeClient, *pendingLedger_))
    , balanceCalculator_(new WalletBalanceCalculator(addressDirectory, coinbaseMaturity_))
    , listingCalculator_(new UtxoListingCalculator(addressDirectory, *massCalculator_, coinbaseMaturity_))
{
    LogPrintf("%s: coinbase maturity %u, sync interval %dms\n", __func__, coinbaseMaturity_, syncIntervalMillis_);
}

WalletModule::~WalletModule()
{
    listingCalculator_.reset();
    balanceCalculator_.reset();
    transactionSubmitter_.reset();
    transactionBuilder_.reset();
    syncEngine_.reset();
    pendingLedger_.reset();
    utxoStore_.reset();
    utxoSelector_.reset();
    feePolicyResolver_.reset();
    dustCalculator_.reset();
    massCalculator_.reset();
    signatureMassEstimator_.reset();
}

void WalletModule::StartSyncThread(boost::thread_group& threadGroup)
{
    boost::function<void()> syncLoop = boost::bind(&SyncEngine::ThreadSyncLoop, syncEngine_.get(), syncIntervalMillis_);
    threadGroup.create_thread(boost::bind(&TraceThread<boost::function<void()> >, "sync", syncLoop));
}

bool WalletModule::IsSynced() const
{
    return syncEngine_->IsSynced();
}

SyncEngine& WalletModule::syncEngine()
{
    return *syncEngine_;
}

const UtxoStore& WalletModule::utxoStore() const
{
    return *utxoStore_;
}

const PendingLedger& WalletModule::pendingLedger() const
{
    return *pendingLedger_;
}

bool WalletModule::CheckIsSynced(WalletErrorKind& errorKind, std::string& errorMessage) const
{
    if (syncEngine_->IsSynced())
        return true;
    errorKind = WalletErrorKind::NOT_SYNCED;
    errorMessage = "Wallet is not synced yet. Please wait for the sync to complete.";
    return false;
}

bool WalletModule::GetBalances(
    bool perAddress,
    WalletBalances& balances,
    std::string& errorMessage) const
{
    WalletErrorKind errorKind = WalletErrorKind::NONE;
    if (!CheckIsSynced(errorKind, errorMessage))
        return false;
    const OverlayUtxoView view = utxoStore_->overlay(*pendingLedger_);
    balances = balanceCalculator_->CalculateBalances(view, perAddress);
    return true;
}

bool WalletModule::ListUtxos(
    const std::vector<std::string>& addressFilter,
    bool includePending,
    bool includeDust,
    std::vector<AddressUtxos>& listing,
    std::string& errorMessage) const
{
    WalletErrorKind errorKind = WalletErrorKind::NONE;
    if (!CheckIsSynced(errorKind, errorMessage))
        return false;
    CFeeRate feeRate;
    if (feePolicyResolver_->ResolveFeeRate(FeePolicy(), feeRate, errorMessage) != WalletErrorKind::NONE)
        return false;
    const OverlayUtxoView view = utxoStore_->overlay(*pendingLedger_);
    listing = listingCalculator_->ListUtxos(view, feeRate, addressFilter, includePending, includeDust);
    return true;
}

TransactionBuildResult WalletModule::CreateUnsignedTransactions(const TransactionBuildRequest& request) const
{
    TransactionBuildResult result;
    if (!CheckIsSynced(result.errorKind, result.errorMessage))
        return result;
    return transactionBuilder_->CreateUnsignedTransactions(request);
}

TransactionSubmissionResult WalletModule::SubmitTransactions(
    const std::vector<WalletSignableTransaction>& signedTransactions) const
{
    return transactionSubmitter_->SubmitTransactions(signedTransactions);
}
