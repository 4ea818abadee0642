#include <UtxoSelector.h>

#include <I_UtxoView.h>
#include <Logging.h>
#include <MassCalculator.h>
#include <OverlayUtxoView.h>

#include <unordered_set>

namespace
{
UtxoSelectionResult& FailSelection(UtxoSelectionResult& result, WalletErrorKind kind, const std::string& message)
{
    result.errorKind = kind;
    result.errorMessage = message;
    LogPrint("selection", "selection failed (%s): %s\n", WalletErrorKindToString(kind), message);
    return result;
}
} // anonymous namespace

UtxoSelector::UtxoSelector(
    const MassCalculator& massCalculator,
    uint64_t coinbaseMaturity,
    CAmount minimumChangeTarget
    ): massCalculator_(massCalculator)
    , coinbaseMaturity_(coinbaseMaturity)
    , minimumChangeTarget_(minimumChangeTarget)
{
}

CAmount UtxoSelector::CalculateFee(
    const CFeeRate& feeRate,
    uint64_t massWithoutInputs,
    size_t inputCount) const
{
    return feeRate.GetFee(massWithoutInputs + inputCount * massCalculator_.CalculateMassPerInput());
}

UtxoSelectionResult UtxoSelector::SelectUtxos(
    const I_UtxoView& view,
    const UtxoSelectionRequest& request) const
{
    UtxoSelectionResult result;
    if (!request.addressRestriction.empty() && !request.preselectedOutPoints.empty())
        return FailSelection(result, WalletErrorKind::USER_INPUT_ERROR, "Cannot restrict addresses and preselect UTXOs at the same time");
    if (!request.sendAll && request.amount == 0)
        return FailSelection(result, WalletErrorKind::USER_INPUT_ERROR, "Amount to send must be positive");

    const uint64_t virtualDaaScore = view.GetVirtualDaaScore();
    const uint64_t massPerInput = massCalculator_.CalculateMassPerInput();
    const auto addUtxo = [&](const WalletUtxo& utxo)
    {
        result.selectedUtxos.push_back(utxo);
        result.totalValue += utxo.amount();
        result.fee = request.feeRate.GetFee(request.massWithoutInputs + result.selectedUtxos.size() * massPerInput);
    };

    OutPointSet preselected;
    for (const COutPoint& outpoint: request.preselectedOutPoints)
    {
        if (!preselected.insert(outpoint).second)
            continue;
        const WalletUtxo* utxo = view.GetUtxo(outpoint);
        if (utxo == nullptr)
            return FailSelection(result, WalletErrorKind::USER_INPUT_ERROR, tfm::format("UTXO %s is not available", outpoint.ToString()));
        if (utxo->IsImmatureCoinbase(virtualDaaScore, coinbaseMaturity_))
            return FailSelection(result, WalletErrorKind::USER_INPUT_ERROR, tfm::format("UTXO %s is an immature coinbase output", outpoint.ToString()));
        addUtxo(*utxo);
    }

    const bool preselectionCovers = !preselected.empty() &&
        (request.sendAll || result.totalValue >= request.amount + result.fee);
    if (!preselectionCovers)
    {
        const std::unordered_set<WalletAddress, WalletAddressHasher> allowedOwners(
            request.addressRestriction.begin(),
            request.addressRestriction.end());
        const auto targetIsReached = [&]() -> bool
        {
            if (request.sendAll)
                return false;
            const CAmount required = request.amount + result.fee;
            if (result.totalValue == required)
                return true;
            return result.totalValue >= required + minimumChangeTarget_ && result.selectedUtxos.size() > 1;
        };
        view.ForEachSortedByAmount(
            [&](const WalletUtxo& utxo) -> bool
            {
                if (preselected.count(utxo.outpoint()) > 0)
                    return true;
                if (!allowedOwners.empty() && allowedOwners.count(utxo.address()) == 0)
                    return true;
                if (utxo.IsImmatureCoinbase(virtualDaaScore, coinbaseMaturity_))
                    return true;
                addUtxo(utxo);
                return !targetIsReached();
            });
    }

    if (result.selectedUtxos.empty())
    {
        if (!request.addressRestriction.empty())
            return FailSelection(result, WalletErrorKind::RESTRICTION_UNSATISFIABLE,
                tfm::format("None of the %u requested addresses holds spendable funds", request.addressRestriction.size()));
        return FailSelection(result, WalletErrorKind::INSUFFICIENT_FUNDS, "No funds to send");
    }

    if (request.sendAll)
    {
        if (result.totalValue <= result.fee)
            return FailSelection(result, WalletErrorKind::INSUFFICIENT_FUNDS,
                tfm::format("Total of %s does not cover the fee of %s", FormatMoney(result.totalValue), FormatMoney(result.fee)));
        result.sendAmount = result.totalValue - result.fee;
        result.changeAmount = 0;
    }
    else
    {
        const CAmount required = request.amount + result.fee;
        if (result.totalValue < required)
            return FailSelection(result, WalletErrorKind::INSUFFICIENT_FUNDS,
                tfm::format("Insufficient funds for send: %s required, while only %s available", FormatMoney(required), FormatMoney(result.totalValue)));
        result.sendAmount = request.amount;
        result.changeAmount = result.totalValue - required;
        if (result.changeAmount < request.minimumChangeValue)
        {
            result.fee += result.changeAmount;
            result.changeAmount = 0;
        }
    }
    LogPrint("selection", "%s: %u utxos worth %s, fee %s, change %s\n",
        __func__,
        result.selectedUtxos.size(),
        FormatMoney(result.totalValue),
        FormatMoney(result.fee),
        FormatMoney(result.changeAmount));
    return result;
}
