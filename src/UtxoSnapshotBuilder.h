#ifndef UTXO_SNAPSHOT_BUILDER_H
#define UTXO_SNAPSHOT_BUILDER_H
#include <UtxoSnapshot.h>

#include <memory>

/** Accumulates UTXOs off to the side and freezes them into a snapshot */
class UtxoSnapshotBuilder
{
private:
    UtxosByOutPoint utxosByOutPoint_;

public:
    UtxoSnapshotBuilder();
    /** Starts from the contents of an already published snapshot */
    explicit UtxoSnapshotBuilder(const UtxoSnapshot& baseSnapshot);

    /** Returns false if the outpoint was already present */
    bool AddUtxo(const WalletUtxo& utxo);
    bool RemoveUtxo(const COutPoint& outpoint);
    bool Contains(const COutPoint& outpoint) const;
    size_t size() const;

    /** Sorts and hands the accumulated UTXOs over to a new snapshot.
     *  The builder is empty afterwards. */
    std::shared_ptr<const UtxoSnapshot> Build(uint64_t generation, uint64_t virtualDaaScore);
};
#endif// UTXO_SNAPSHOT_BUILDER_H
