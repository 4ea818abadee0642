#ifndef WALLET_UTXO_H
#define WALLET_UTXO_H
#include <OutPoint.h>
#include <UtxoEntry.h>
#include <WalletAddress.h>

/** A spendable output owned by the wallet. Immutable once constructed. */
class WalletUtxo
{
private:
    COutPoint outpoint_;
    UtxoEntry utxoEntry_;
    WalletAddress address_;

public:
    WalletUtxo(
        const COutPoint& outpoint,
        const UtxoEntry& utxoEntry,
        const WalletAddress& address);

    const COutPoint& outpoint() const { return outpoint_; }
    const UtxoEntry& utxoEntry() const { return utxoEntry_; }
    const WalletAddress& address() const { return address_; }
    CAmount amount() const { return utxoEntry_.amount; }

    /** Coinbase outputs younger than the maturity window cannot be spent yet */
    bool IsImmatureCoinbase(uint64_t virtualDaaScore, uint64_t coinbaseMaturity) const;
    std::string ToString() const;
};
#endif// WALLET_UTXO_H
