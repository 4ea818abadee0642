#ifndef TRANSACTION_BUILDER_H
#define TRANSACTION_BUILDER_H
#include <amount.h>
#include <FeePolicy.h>
#include <OutPoint.h>
#include <OverlayUtxoView.h>
#include <WalletError.h>
#include <WalletSignableTransaction.h>
#include <WalletUtxo.h>

#include <string>
#include <vector>

class DustCalculator;
class I_AddressDirectory;
class I_AddressEncoder;
class I_UtxoView;
class MassCalculator;
class PendingLedger;
class UtxoSelector;
class UtxoStore;

struct TransactionBuildRequest
{
    std::string toAddress;
    CAmount amount;
    bool isSendAll;
    FeePolicy feePolicy;
    /** Only spend from these wallet addresses; change returns to the first */
    std::vector<std::string> fromAddresses;
    std::vector<COutPoint> preselectedOutPoints;
    bool useExistingChangeAddress;
    std::vector<unsigned char> payload;

    TransactionBuildRequest(
        ): toAddress()
        , amount(0)
        , isSendAll(false)
        , feePolicy()
        , fromAddresses()
        , preselectedOutPoints()
        , useExistingChangeAddress(false)
        , payload()
    {
    }
};

struct TransactionBuildResult
{
    /** Merge transactions first, the paying transaction last */
    std::vector<WalletSignableTransaction> transactions;
    std::vector<WalletUtxo> selectedUtxos;
    CAmount sentAmount;
    CAmount changeAmount;
    CAmount totalFee;
    WalletErrorKind errorKind;
    std::string errorMessage;

    TransactionBuildResult(
        ): transactions()
        , selectedUtxos()
        , sentAmount(0)
        , changeAmount(0)
        , totalFee(0)
        , errorKind(WalletErrorKind::NONE)
        , errorMessage()
    {
    }
    bool succeeded() const { return errorKind == WalletErrorKind::NONE; }
};

/** Builds unsigned transactions against an overlay of the current snapshot
 *  and the pending ledger. Nothing is recorded anywhere until the signed
 *  transactions are submitted. */
class TransactionBuilder
{
private:
    struct BuildContext;

    I_AddressDirectory& addressDirectory_;
    const I_AddressEncoder& addressEncoder_;
    const UtxoStore& utxoStore_;
    const PendingLedger& pendingLedger_;
    const FeePolicyResolver& feePolicyResolver_;
    const MassCalculator& massCalculator_;
    const DustCalculator& dustCalculator_;
    const UtxoSelector& utxoSelector_;

    WalletSignableTransaction CreateSignableTransaction(
        const BuildContext& context,
        const std::vector<WalletUtxo>& inputs,
        CAmount sendAmount,
        CAmount changeAmount) const;
    /** spentInChain holds every outpoint consumed by the chain built so far */
    bool MaybeAutoCompound(
        const BuildContext& context,
        const I_UtxoView& view,
        const WalletSignableTransaction& transaction,
        OutPointSet& spentInChain,
        TransactionBuildResult& result) const;
    bool CreateMergeTransaction(
        const BuildContext& context,
        const std::vector<WalletUtxo>& inputs,
        TransactionBuildResult& result,
        std::vector<WalletUtxo>& mergedOutputs) const;

public:
    TransactionBuilder(
        I_AddressDirectory& addressDirectory,
        const I_AddressEncoder& addressEncoder,
        const UtxoStore& utxoStore,
        const PendingLedger& pendingLedger,
        const FeePolicyResolver& feePolicyResolver,
        const MassCalculator& massCalculator,
        const DustCalculator& dustCalculator,
        const UtxoSelector& utxoSelector);

    TransactionBuildResult CreateUnsignedTransactions(const TransactionBuildRequest& request) const;
    /** Inputs must cover outputs and the fee must meet the minimum relay rate */
    bool CheckTransactionFeeRate(
        const WalletSignableTransaction& transaction,
        std::string& errorMessage) const;
};
#endif// TRANSACTION_BUILDER_H
