#ifndef I_UTXO_VIEW_H
#define I_UTXO_VIEW_H
#include <OutPoint.h>
#include <WalletUtxo.h>

#include <functional>
#include <stddef.h>
#include <vector>

/** Read access to a wallet UTXO set. Implemented once by a plain snapshot
 *  and once by a snapshot composed with the wallet's pending transactions.
 */
class I_UtxoView
{
public:
    /** Return false from the visitor to stop the walk early */
    typedef std::function<bool(const WalletUtxo&)> UtxoVisitor;

    virtual ~I_UtxoView(){}
    virtual bool Contains(const COutPoint& outpoint) const = 0;
    /** Null when the outpoint is unknown or already spent */
    virtual const WalletUtxo* GetUtxo(const COutPoint& outpoint) const = 0;
    /** Walks the consensus UTXOs ascending by (amount, outpoint) */
    virtual void ForEachSortedByAmount(const UtxoVisitor& visitor) const = 0;
    /** Outputs of not yet confirmed wallet transactions, not part of the sorted walk */
    virtual std::vector<WalletUtxo> GetPendingAdditions() const = 0;
    virtual bool IsEmpty() const = 0;
    virtual uint64_t GetVirtualDaaScore() const = 0;
};
#endif// I_UTXO_VIEW_H
