#ifndef OVERLAY_UTXO_VIEW_H
#define OVERLAY_UTXO_VIEW_H
#include <I_UtxoView.h>
#include <PendingLedger.h>
#include <UtxoSnapshot.h>

#include <memory>
#include <unordered_set>
#include <vector>

typedef std::unordered_set<COutPoint, OutPointHasher> OutPointSet;

/** A consensus snapshot seen through the wallet's own unconfirmed spends.
 *
 *  Outpoints consumed by a pending transaction are hidden, and wallet-owned
 *  outputs of pending transactions become visible to lookups. Those outputs
 *  are never part of the sorted walk; they are listed by GetPendingAdditions.
 */
class OverlayUtxoView final: public I_UtxoView
{
private:
    std::shared_ptr<const UtxoSnapshot> snapshot_;
    OutPointSet excludedOutPoints_;
    UtxosByOutPoint additions_;

public:
    OverlayUtxoView(
        std::shared_ptr<const UtxoSnapshot> snapshot,
        const std::vector<PendingTransactionReference>& pendingTransactions);

    bool Contains(const COutPoint& outpoint) const override;
    const WalletUtxo* GetUtxo(const COutPoint& outpoint) const override;
    void ForEachSortedByAmount(const UtxoVisitor& visitor) const override;
    std::vector<WalletUtxo> GetPendingAdditions() const override;
    bool IsEmpty() const override;
    uint64_t GetVirtualDaaScore() const override;

    const UtxoSnapshot& snapshot() const { return *snapshot_; }
    const OutPointSet& GetExcludedOutPoints() const { return excludedOutPoints_; }
};
#endif// OVERLAY_UTXO_VIEW_H
