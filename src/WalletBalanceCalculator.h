#ifndef WALLET_BALANCE_CALCULATOR_H
#define WALLET_BALANCE_CALCULATOR_H
#include <amount.h>

#include <stdint.h>
#include <string>
#include <vector>

class I_AddressDirectory;
class I_UtxoView;

struct AddressBalance
{
    std::string address;
    CAmount available;
    CAmount pending;

    explicit AddressBalance(
        const std::string& addressIn
        ): address(addressIn)
        , available(0)
        , pending(0)
    {
    }
};

struct WalletBalances
{
    CAmount available;
    CAmount pending;
    /** Ordered by address, only filled when requested */
    std::vector<AddressBalance> addressBalances;

    WalletBalances(
        ): available(0)
        , pending(0)
        , addressBalances()
    {
    }
};

/** Available funds are mature consensus UTXOs. Immature coinbase outputs and
 *  outputs of the wallet's own pending transactions count as pending. */
class WalletBalanceCalculator
{
private:
    const I_AddressDirectory& addressDirectory_;
    const uint64_t coinbaseMaturity_;

public:
    WalletBalanceCalculator(
        const I_AddressDirectory& addressDirectory,
        uint64_t coinbaseMaturity);

    WalletBalances CalculateBalances(const I_UtxoView& view, bool perAddress) const;
};
#endif// WALLET_BALANCE_CALCULATOR_H
