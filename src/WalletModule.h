#ifndef WALLET_MODULE_H
#define WALLET_MODULE_H
#include <TransactionBuilder.h>
#include <TransactionSubmitter.h>
#include <UtxoListingCalculator.h>
#include <WalletBalanceCalculator.h>

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

namespace boost
{
class thread_group;
} // namespace boost

class CopyableSettings;
class DustCalculator;
class FeePolicyResolver;
class I_AddressDirectory;
class I_AddressEncoder;
class I_NodeClient;
class I_SignatureMassEstimator;
class MassCalculator;
class PendingLedger;
class SyncEngine;
class UtxoSelector;
class UtxoStore;

/** Owns the UTXO state of one wallet and serves every request against it.
 *
 *  Requests are refused until the first sync cycle has completed. Each
 *  read is answered from a single overlay of the current snapshot and the
 *  pending ledger.
 */
class WalletModule
{
private:
    const uint64_t coinbaseMaturity_;
    const int64_t syncIntervalMillis_;
    std::unique_ptr<I_SignatureMassEstimator> signatureMassEstimator_;
    std::unique_ptr<MassCalculator> massCalculator_;
    std::unique_ptr<DustCalculator> dustCalculator_;
    std::unique_ptr<FeePolicyResolver> feePolicyResolver_;
    std::unique_ptr<UtxoSelector> utxoSelector_;
    std::unique_ptr<UtxoStore> utxoStore_;
    std::unique_ptr<PendingLedger> pendingLedger_;
    std::unique_ptr<SyncEngine> syncEngine_;
    std::unique_ptr<TransactionBuilder> transactionBuilder_;
    std::unique_ptr<TransactionSubmitter> transactionSubmitter_;
    std::unique_ptr<WalletBalanceCalculator> balanceCalculator_;
    std::unique_ptr<UtxoListingCalculator> listingCalculator_;

    bool CheckIsSynced(WalletErrorKind& errorKind, std::string& errorMessage) const;

public:
    /** Throws std::runtime_error when the settings describe no usable wallet */
    WalletModule(
        const CopyableSettings& settings,
        I_AddressDirectory& addressDirectory,
        const I_AddressEncoder& addressEncoder,
        const I_NodeClient& nodeClient,
        unsigned cosignerCount);
    ~WalletModule();

    void StartSyncThread(boost::thread_group& threadGroup);
    bool IsSynced() const;
    SyncEngine& syncEngine();
    const UtxoStore& utxoStore() const;
    const PendingLedger& pendingLedger() const;

    bool GetBalances(
        bool perAddress,
        WalletBalances& balances,
        std::string& errorMessage) const;
    bool ListUtxos(
        const std::vector<std::string>& addressFilter,
        bool includePending,
        bool includeDust,
        std::vector<AddressUtxos>& listing,
        std::string& errorMessage) const;
    TransactionBuildResult CreateUnsignedTransactions(const TransactionBuildRequest& request) const;
    TransactionSubmissionResult SubmitTransactions(
        const std::vector<WalletSignableTransaction>& signedTransactions) const;
};
#endif// WALLET_MODULE_H
