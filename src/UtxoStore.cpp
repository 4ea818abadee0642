#include <UtxoStore.h>

#include <Logging.h>
#include <PendingLedger.h>

#include <atomic>
#include <cassert>

UtxoStore::UtxoStore(
    ): current_(std::make_shared<const UtxoSnapshot>())
{
}

void UtxoStore::publish(std::shared_ptr<const UtxoSnapshot> snapshot)
{
    assert(snapshot);
    const uint64_t generation = snapshot->GetGeneration();
    const size_t utxoCount = snapshot->size();
    std::atomic_store(&current_, std::move(snapshot));
    LogPrint("sync", "%s: snapshot %u with %u utxos is now current\n", __func__, generation, utxoCount);
}

std::shared_ptr<const UtxoSnapshot> UtxoStore::current() const
{
    return std::atomic_load(&current_);
}

OverlayUtxoView UtxoStore::overlay(const PendingLedger& pendingLedger) const
{
    std::shared_ptr<const UtxoSnapshot> snapshot = current();
    return OverlayUtxoView(snapshot, pendingLedger.GetPendingTransactions());
}
