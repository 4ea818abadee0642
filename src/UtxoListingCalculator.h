#ifndef UTXO_LISTING_CALCULATOR_H
#define UTXO_LISTING_CALCULATOR_H
#include <WalletUtxo.h>

#include <stdint.h>
#include <string>
#include <vector>

class CFeeRate;
class I_AddressDirectory;
class I_UtxoView;
class MassCalculator;

struct ListedUtxo
{
    WalletUtxo utxo;
    /** Immature coinbase, or an output of a not yet accepted wallet transaction */
    bool isPending;
    /** Worth less than the fee needed to spend it */
    bool isDust;

    ListedUtxo(
        const WalletUtxo& utxoIn,
        bool isPendingIn,
        bool isDustIn
        ): utxo(utxoIn)
        , isPending(isPendingIn)
        , isDust(isDustIn)
    {
    }
};

struct AddressUtxos
{
    std::string address;
    std::vector<ListedUtxo> utxos;
};

class UtxoListingCalculator
{
private:
    const I_AddressDirectory& addressDirectory_;
    const MassCalculator& massCalculator_;
    const uint64_t coinbaseMaturity_;

public:
    UtxoListingCalculator(
        const I_AddressDirectory& addressDirectory,
        const MassCalculator& massCalculator,
        uint64_t coinbaseMaturity);

    /** Groups the view's UTXOs by address, ordered by address and then by
     *  amount. An empty filter lists every address. */
    std::vector<AddressUtxos> ListUtxos(
        const I_UtxoView& view,
        const CFeeRate& feeRate,
        const std::vector<std::string>& addressFilter,
        bool includePending,
        bool includeDust) const;
};
#endif// UTXO_LISTING_CALCULATOR_H
