#ifndef UTXO_SELECTOR_H
#define UTXO_SELECTOR_H
#include <amount.h>
#include <FeeRate.h>
#include <OutPoint.h>
#include <WalletAddress.h>
#include <WalletError.h>
#include <WalletUtxo.h>

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

class I_UtxoView;
class MassCalculator;

struct UtxoSelectionRequest
{
    CAmount amount;
    bool sendAll;
    CFeeRate feeRate;
    std::vector<WalletAddress> addressRestriction;
    std::vector<COutPoint> preselectedOutPoints;
    /** Mass of the transaction being funded, outputs and payload included */
    uint64_t massWithoutInputs;
    /** Change below this is added to the fee instead */
    CAmount minimumChangeValue;

    UtxoSelectionRequest(
        ): amount(0)
        , sendAll(false)
        , feeRate()
        , addressRestriction()
        , preselectedOutPoints()
        , massWithoutInputs(0u)
        , minimumChangeValue(0)
    {
    }
};

struct UtxoSelectionResult
{
    std::vector<WalletUtxo> selectedUtxos;
    CAmount totalValue;
    CAmount sendAmount;
    CAmount changeAmount;
    CAmount fee;
    WalletErrorKind errorKind;
    std::string errorMessage;

    UtxoSelectionResult(
        ): selectedUtxos()
        , totalValue(0)
        , sendAmount(0)
        , changeAmount(0)
        , fee(0)
        , errorKind(WalletErrorKind::NONE)
        , errorMessage()
    {
    }
    bool succeeded() const { return errorKind == WalletErrorKind::NONE; }
};

/** Picks inputs from a UTXO view, smallest amounts first.
 *
 *  The fee depends on the number of inputs, so it is recomputed after every
 *  pick. For a fixed amount the walk stops on an exact match, or once the
 *  leftover reaches the minimum change target with more than one input;
 *  a send-all takes every eligible UTXO.
 */
class UtxoSelector
{
private:
    const MassCalculator& massCalculator_;
    const uint64_t coinbaseMaturity_;
    const CAmount minimumChangeTarget_;

public:
    UtxoSelector(
        const MassCalculator& massCalculator,
        uint64_t coinbaseMaturity,
        CAmount minimumChangeTarget);

    UtxoSelectionResult SelectUtxos(
        const I_UtxoView& view,
        const UtxoSelectionRequest& request) const;
    CAmount CalculateFee(
        const CFeeRate& feeRate,
        uint64_t massWithoutInputs,
        size_t inputCount) const;
    uint64_t GetCoinbaseMaturity() const { return coinbaseMaturity_; }
};
#endif// UTXO_SELECTOR_H
