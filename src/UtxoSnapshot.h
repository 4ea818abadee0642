#ifndef UTXO_SNAPSHOT_H
#define UTXO_SNAPSHOT_H
#include <I_UtxoView.h>
#include <OutPoint.h>
#include <WalletUtxo.h>

#include <unordered_map>
#include <utility>
#include <vector>

typedef std::pair<CAmount, COutPoint> AmountAndOutPoint;
typedef std::unordered_map<COutPoint, WalletUtxo, OutPointHasher> UtxosByOutPoint;

/** Immutable point-in-time image of the wallet's consensus UTXO set.
 *
 *  Besides the outpoint index it keeps every key once more in a sequence
 *  ordered by (amount, outpoint). Both hold exactly the same keys.
 *  Instances are only created by UtxoSnapshotBuilder and are shared by
 *  reference once published.
 */
class UtxoSnapshot final: public I_UtxoView
{
private:
    const uint64_t generation_;
    const uint64_t virtualDaaScore_;
    const UtxosByOutPoint utxosByOutPoint_;
    const std::vector<AmountAndOutPoint> sortedByAmount_;

    void AssertIsConsistent() const;

public:
    UtxoSnapshot();
    UtxoSnapshot(
        uint64_t generation,
        uint64_t virtualDaaScore,
        UtxosByOutPoint&& utxosByOutPoint,
        std::vector<AmountAndOutPoint>&& sortedByAmount);

    bool Contains(const COutPoint& outpoint) const override;
    const WalletUtxo* GetUtxo(const COutPoint& outpoint) const override;
    void ForEachSortedByAmount(const UtxoVisitor& visitor) const override;
    std::vector<WalletUtxo> GetPendingAdditions() const override;
    bool IsEmpty() const override;
    uint64_t GetVirtualDaaScore() const override;

    uint64_t GetGeneration() const { return generation_; }
    size_t size() const { return utxosByOutPoint_.size(); }
    const UtxosByOutPoint& GetUtxosByOutPoint() const { return utxosByOutPoint_; }
    const std::vector<AmountAndOutPoint>& GetSortedByAmount() const { return sortedByAmount_; }
};
#endif// UTXO_SNAPSHOT_H
