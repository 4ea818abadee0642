#include <TransactionBuilder.h>

#include <DustCalculator.h>
#include <I_AddressDirectory.h>
#include <I_AddressEncoder.h>
#include <I_UtxoView.h>
#include <Logging.h>
#include <MassCalculator.h>
#include <OverlayUtxoView.h>
#include <PendingLedger.h>
#include <UtxoSelector.h>
#include <UtxoStore.h>
#include <defaultValues.h>

#include <algorithm>
#include <unordered_set>

struct TransactionBuilder::BuildContext
{
    CFeeRate feeRate;
    CTxOut recipientOutput;
    bool recipientIsOwned;
    WalletAddress recipientOwner;
    CTxOut changeOutput;
    WalletAddress changeOwner;
    std::vector<unsigned char> payload;
    CAmount amount;
    bool isSendAll;
    bool usesPreselection;
    std::vector<WalletAddress> addressRestriction;
    uint64_t massWithoutInputs;
    CAmount minimumChangeValue;

    BuildContext(
        ): feeRate()
        , recipientOutput()
        , recipientIsOwned(false)
        , recipientOwner()
        , changeOutput()
        , changeOwner()
        , payload()
        , amount(0)
        , isSendAll(false)
        , usesPreselection(false)
        , addressRestriction()
        , massWithoutInputs(0u)
        , minimumChangeValue(0)
    {
    }
};

namespace
{
bool FailBuild(
    TransactionBuildResult& result,
    WalletErrorKind kind,
    const std::string& message)
{
    result.errorKind = kind;
    result.errorMessage = message;
    return error("%s: %s", WalletErrorKindToString(kind), message);
}

CAmount AttachInputs(
    const std::vector<WalletUtxo>& inputs,
    uint8_t sigOpCount,
    CMutableTransaction& txNew,
    std::vector<UtxoEntry>& spentEntries,
    std::vector<WalletAddress>& addressByInputIndex)
{
    CAmount nValueIn = 0;
    for (const WalletUtxo& utxo: inputs)
    {
        txNew.vin.emplace_back(utxo.outpoint(), sigOpCount);
        spentEntries.push_back(utxo.utxoEntry());
        addressByInputIndex.push_back(utxo.address());
        nValueIn += utxo.amount();
    }
    return nValueIn;
}

std::vector<WalletUtxo> GetSpentUtxos(const WalletSignableTransaction& transaction)
{
    const CTransaction& tx = transaction.transaction();
    std::vector<WalletUtxo> spentUtxos;
    spentUtxos.reserve(tx.vin.size());
    for (unsigned inputIndex = 0; inputIndex < tx.vin.size(); ++inputIndex)
    {
        spentUtxos.emplace_back(
            tx.vin[inputIndex].prevout,
            transaction.spentEntries()[inputIndex],
            transaction.addressByInputIndex()[inputIndex]);
    }
    return spentUtxos;
}

CAmount SumAmounts(const std::vector<WalletUtxo>& utxos)
{
    CAmount total = 0;
    for (const WalletUtxo& utxo: utxos)
    {
        total += utxo.amount();
    }
    return total;
}
} // anonymous namespace

TransactionBuilder::TransactionBuilder(
    I_AddressDirectory& addressDirectory,
    const I_AddressEncoder& addressEncoder,
    const UtxoStore& utxoStore,
    const PendingLedger& pendingLedger,
    const FeePolicyResolver& feePolicyResolver,
    const MassCalculator& massCalculator,
    const DustCalculator& dustCalculator,
    const UtxoSelector& utxoSelector
    ): addressDirectory_(addressDirectory)
    , addressEncoder_(addressEncoder)
    , utxoStore_(utxoStore)
    , pendingLedger_(pendingLedger)
    , feePolicyResolver_(feePolicyResolver)
    , massCalculator_(massCalculator)
    , dustCalculator_(dustCalculator)
    , utxoSelector_(utxoSelector)
{
}

WalletSignableTransaction TransactionBuilder::CreateSignableTransaction(
    const BuildContext& context,
    const std::vector<WalletUtxo>& inputs,
    CAmount sendAmount,
    CAmount changeAmount) const
{
    CMutableTransaction txNew;
    std::vector<UtxoEntry> spentEntries;
    std::vector<WalletAddress> addressByInputIndex;
    AttachInputs(inputs, massCalculator_.SigOpCountPerInput(), txNew, spentEntries, addressByInputIndex);

    std::map<unsigned, WalletAddress> addressByOutputIndex;
    txNew.vout.emplace_back(sendAmount, context.recipientOutput.scriptPubKey);
    if (context.recipientIsOwned)
        addressByOutputIndex.insert(std::make_pair(0u, context.recipientOwner));
    if (changeAmount > 0)
    {
        txNew.vout.emplace_back(changeAmount, context.changeOutput.scriptPubKey);
        addressByOutputIndex.insert(std::make_pair(static_cast<unsigned>(txNew.vout.size() - 1u), context.changeOwner));
    }
    txNew.payload = context.payload;
    return WalletSignableTransaction(CTransaction(txNew), spentEntries, addressByInputIndex, addressByOutputIndex);
}

bool TransactionBuilder::CreateMergeTransaction(
    const BuildContext& context,
    const std::vector<WalletUtxo>& inputs,
    TransactionBuildResult& result,
    std::vector<WalletUtxo>& mergedOutputs) const
{
    CMutableTransaction txNew;
    std::vector<UtxoEntry> spentEntries;
    std::vector<WalletAddress> addressByInputIndex;
    const CAmount nValueIn = AttachInputs(inputs, massCalculator_.SigOpCountPerInput(), txNew, spentEntries, addressByInputIndex);
    txNew.vout.push_back(context.changeOutput);
    const CAmount fee = context.feeRate.GetFee(massCalculator_.CalculateTransactionMass(txNew));
    if (nValueIn <= fee)
        return FailBuild(result, WalletErrorKind::INSUFFICIENT_FUNDS,
            tfm::format("Inputs worth %s cannot pay the merge fee of %s", FormatMoney(nValueIn), FormatMoney(fee)));
    txNew.vout[0].nValue = nValueIn - fee;

    std::map<unsigned, WalletAddress> addressByOutputIndex;
    addressByOutputIndex.insert(std::make_pair(0u, context.changeOwner));
    const CTransaction mergeTransaction(txNew);
    result.transactions.emplace_back(mergeTransaction, spentEntries, addressByInputIndex, addressByOutputIndex);
    mergedOutputs.emplace_back(
        COutPoint(mergeTransaction.GetHash(), 0u),
        UtxoEntry(nValueIn - fee, context.changeOutput.scriptPubKey, UNACCEPTED_DAA_SCORE, false),
        context.changeOwner);
    return true;
}

bool TransactionBuilder::MaybeAutoCompound(
    const BuildContext& context,
    const I_UtxoView& view,
    const WalletSignableTransaction& transaction,
    OutPointSet& spentInChain,
    TransactionBuildResult& result) const
{
    const CTransaction& oversized = transaction.transaction();
    const uint64_t mass = massCalculator_.CalculateTransactionMass(oversized);
    if (mass < MAXIMUM_STANDARD_TRANSACTION_MASS)
    {
        result.transactions.push_back(transaction);
        return true;
    }
    if (oversized.vout.empty() || oversized.vout.size() > 2u)
        return FailBuild(result, WalletErrorKind::SANITY_CHECK_FAILED,
            tfm::format("Transaction with %u outputs cannot be split", oversized.vout.size()));

    const uint64_t massPerInput = massCalculator_.CalculateMassPerInput();
    const uint64_t splitMassWithoutInputs =
        massCalculator_.CalculateMassWithoutInputs(std::vector<CTxOut>(1u, context.changeOutput), 0u);
    const std::vector<WalletUtxo> spentUtxos = GetSpentUtxos(transaction);
    const size_t inputsPerSplit = splitMassWithoutInputs < MAXIMUM_STANDARD_TRANSACTION_MASS
        ? (MAXIMUM_STANDARD_TRANSACTION_MASS - splitMassWithoutInputs) / massPerInput
        : 0u;
    const size_t splitCount = inputsPerSplit > 0u
        ? (spentUtxos.size() + inputsPerSplit - 1u) / inputsPerSplit
        : 0u;
    if (splitCount == 0u || splitCount >= spentUtxos.size())
        return FailBuild(result, WalletErrorKind::SANITY_CHECK_FAILED,
            tfm::format("Transaction of mass %u cannot be brought below the mass limit of %u", mass, MAXIMUM_STANDARD_TRANSACTION_MASS));
    LogPrint("mass", "%s: mass %u exceeds the limit, merging %u inputs with %u transactions of up to %u inputs\n",
        __func__, mass, spentUtxos.size(), splitCount, inputsPerSplit);

    std::vector<WalletUtxo> finalInputs;
    finalInputs.reserve(splitCount);
    for (size_t splitIndex = 0u; splitIndex < splitCount; ++splitIndex)
    {
        const size_t first = splitIndex * inputsPerSplit;
        const size_t last = std::min(first + inputsPerSplit, spentUtxos.size());
        const std::vector<WalletUtxo> splitInputs(spentUtxos.begin() + first, spentUtxos.begin() + last);
        if (!CreateMergeTransaction(context, splitInputs, result, finalInputs))
            return false;
    }

    CAmount totalValue = SumAmounts(finalInputs);
    const auto feeForInputCount = [&](size_t inputCount) -> CAmount
    {
        return context.feeRate.GetFee(context.massWithoutInputs + inputCount * massPerInput);
    };
    CAmount sendAmount = 0;
    CAmount changeAmount = 0;
    if (context.isSendAll)
    {
        const CAmount fee = feeForInputCount(finalInputs.size());
        if (totalValue <= fee)
            return FailBuild(result, WalletErrorKind::INSUFFICIENT_FUNDS,
                tfm::format("Merged total of %s does not cover the fee of %s", FormatMoney(totalValue), FormatMoney(fee)));
        sendAmount = totalValue - fee;
    }
    else
    {
        sendAmount = oversized.vout[0].nValue;
        CAmount fee = feeForInputCount(finalInputs.size());
        if (totalValue < sendAmount + fee)
        {
            if (context.usesPreselection)
                return FailBuild(result, WalletErrorKind::INSUFFICIENT_FUNDS,
                    tfm::format("Preselected UTXOs cannot cover the fees of %u merge transactions", splitCount));

            const std::unordered_set<WalletAddress, WalletAddressHasher> allowedOwners(
                context.addressRestriction.begin(),
                context.addressRestriction.end());
            const uint64_t virtualDaaScore = view.GetVirtualDaaScore();
            view.ForEachSortedByAmount(
                [&](const WalletUtxo& utxo) -> bool
                {
                    if (spentInChain.count(utxo.outpoint()) > 0)
                        return true;
                    if (!allowedOwners.empty() && allowedOwners.count(utxo.address()) == 0)
                        return true;
                    if (utxo.IsImmatureCoinbase(virtualDaaScore, utxoSelector_.GetCoinbaseMaturity()))
                        return true;
                    spentInChain.insert(utxo.outpoint());
                    finalInputs.push_back(utxo);
                    result.selectedUtxos.push_back(utxo);
                    totalValue += utxo.amount();
                    fee = feeForInputCount(finalInputs.size());
                    return totalValue < sendAmount + fee;
                });
            if (totalValue < sendAmount + fee)
                return FailBuild(result, WalletErrorKind::INSUFFICIENT_FUNDS,
                    tfm::format("Insufficient funds to pay the fees of %u merge transactions", splitCount));
        }
        changeAmount = totalValue - sendAmount - fee;
        if (changeAmount < context.minimumChangeValue)
            changeAmount = 0;
    }
    const WalletSignableTransaction finalTransaction =
        CreateSignableTransaction(context, finalInputs, sendAmount, changeAmount);
    return MaybeAutoCompound(context, view, finalTransaction, spentInChain, result);
}

bool TransactionBuilder::CheckTransactionFeeRate(
    const WalletSignableTransaction& transaction,
    std::string& errorMessage) const
{
    const CTransaction& tx = transaction.transaction();
    const CAmount nValueIn = transaction.GetValueIn();
    const CAmount nValueOut = tx.GetValueOut();
    if (nValueIn < nValueOut)
    {
        errorMessage = tfm::format("Transaction %s spends %s but pays out %s",
            tx.GetHash().ToString(), FormatMoney(nValueIn), FormatMoney(nValueOut));
        return false;
    }
    const uint64_t mass = massCalculator_.CalculateTransactionMass(tx);
    const CFeeRate paidFeeRate(nValueIn - nValueOut, mass);
    const CFeeRate minimumFeeRate(MINIMUM_RELAY_FEE_PER_KILOGRAM);
    if (paidFeeRate < minimumFeeRate)
    {
        errorMessage = tfm::format("Transaction %s pays %s, below the minimum of %s",
            tx.GetHash().ToString(), paidFeeRate.ToString(), minimumFeeRate.ToString());
        return false;
    }
    return true;
}

TransactionBuildResult TransactionBuilder::CreateUnsignedTransactions(const TransactionBuildRequest& request) const
{
    TransactionBuildResult result;
    if (request.toAddress.empty())
    {
        FailBuild(result, WalletErrorKind::USER_INPUT_ERROR, "Recipient address is required");
        return result;
    }
    if (request.isSendAll && request.amount != 0)
    {
        FailBuild(result, WalletErrorKind::USER_INPUT_ERROR, "Cannot specify an amount when sending all funds");
        return result;
    }
    if (!request.fromAddresses.empty() && !request.preselectedOutPoints.empty())
    {
        FailBuild(result, WalletErrorKind::USER_INPUT_ERROR, "Cannot restrict addresses and preselect UTXOs at the same time");
        return result;
    }

    BuildContext context;
    context.amount = request.amount;
    context.isSendAll = request.isSendAll;
    context.usesPreselection = !request.preselectedOutPoints.empty();
    context.payload = request.payload;

    const std::shared_ptr<const VersionedAddressOwnerMap> ownerMap = addressDirectory_.GetAddressOwnerMap();
    for (const std::string& fromAddress: request.fromAddresses)
    {
        const auto it = ownerMap->ownerByAddress.find(fromAddress);
        if (it == ownerMap->ownerByAddress.end())
        {
            FailBuild(result, WalletErrorKind::USER_INPUT_ERROR, tfm::format("Address %s is not part of this wallet", fromAddress));
            return result;
        }
        context.addressRestriction.push_back(it->second);
    }

    ScriptPublicKey recipientScript;
    if (!addressEncoder_.GetScriptForAddress(request.toAddress, recipientScript))
    {
        FailBuild(result, WalletErrorKind::USER_INPUT_ERROR, tfm::format("Invalid recipient address %s", request.toAddress));
        return result;
    }
    context.recipientOutput = CTxOut(0, recipientScript);
    const auto recipient = ownerMap->ownerByAddress.find(request.toAddress);
    if (recipient != ownerMap->ownerByAddress.end())
    {
        context.recipientIsOwned = true;
        context.recipientOwner = recipient->second;
    }

    std::string feeError;
    const WalletErrorKind feeErrorKind = feePolicyResolver_.ResolveFeeRate(request.feePolicy, context.feeRate, feeError);
    if (feeErrorKind != WalletErrorKind::NONE)
    {
        FailBuild(result, feeErrorKind, feeError);
        return result;
    }

    std::string changeAddress;
    if (!addressDirectory_.GetChangeAddress(request.useExistingChangeAddress, request.fromAddresses, changeAddress, context.changeOwner))
    {
        FailBuild(result, WalletErrorKind::USER_INPUT_ERROR, "Unable to determine a change address");
        return result;
    }
    ScriptPublicKey changeScript;
    if (!addressEncoder_.GetScriptForAddress(changeAddress, changeScript))
    {
        FailBuild(result, WalletErrorKind::SANITY_CHECK_FAILED, tfm::format("Change address %s has no script", changeAddress));
        return result;
    }
    context.changeOutput = CTxOut(0, changeScript);

    std::vector<CTxOut> outputs;
    outputs.push_back(context.recipientOutput);
    outputs.push_back(context.changeOutput);
    context.massWithoutInputs = massCalculator_.CalculateMassWithoutInputs(outputs, context.payload.size());
    context.minimumChangeValue = dustCalculator_.MinimumValueForNonDust(context.changeOutput);

    const OverlayUtxoView view = utxoStore_.overlay(pendingLedger_);
    UtxoSelectionRequest selectionRequest;
    selectionRequest.amount = request.amount;
    selectionRequest.sendAll = request.isSendAll;
    selectionRequest.feeRate = context.feeRate;
    selectionRequest.addressRestriction = context.addressRestriction;
    selectionRequest.preselectedOutPoints = request.preselectedOutPoints;
    selectionRequest.massWithoutInputs = context.massWithoutInputs;
    selectionRequest.minimumChangeValue = context.minimumChangeValue;
    const UtxoSelectionResult selection = utxoSelector_.SelectUtxos(view, selectionRequest);
    if (!selection.succeeded())
    {
        result.errorKind = selection.errorKind;
        result.errorMessage = selection.errorMessage;
        return result;
    }
    result.selectedUtxos = selection.selectedUtxos;

    OutPointSet spentInChain;
    for (const WalletUtxo& utxo: selection.selectedUtxos)
    {
        spentInChain.insert(utxo.outpoint());
    }
    const WalletSignableTransaction transaction =
        CreateSignableTransaction(context, selection.selectedUtxos, selection.sendAmount, selection.changeAmount);
    if (!MaybeAutoCompound(context, view, transaction, spentInChain, result))
    {
        result.transactions.clear();
        return result;
    }

    for (const WalletSignableTransaction& builtTransaction: result.transactions)
    {
        std::string sanityError;
        if (!CheckTransactionFeeRate(builtTransaction, sanityError))
        {
            FailBuild(result, WalletErrorKind::SANITY_CHECK_FAILED, sanityError);
            result.transactions.clear();
            return result;
        }
        result.totalFee += builtTransaction.GetFee();
    }
    const CTransaction& finalTransaction = result.transactions.back().transaction();
    result.sentAmount = finalTransaction.vout[0].nValue;
    result.changeAmount = finalTransaction.vout.size() > 1u ? finalTransaction.vout[1].nValue : 0;
    LogPrint("selection", "%s: %u transactions sending %s to %s, change %s, fees %s\n",
        __func__,
        result.transactions.size(),
        FormatMoney(result.sentAmount),
        request.toAddress,
        FormatMoney(result.changeAmount),
        FormatMoney(result.totalFee));
    return result;
}
