#ifndef UTXO_STORE_H
#define UTXO_STORE_H
#include <OverlayUtxoView.h>
#include <UtxoSnapshot.h>

#include <memory>

class PendingLedger;

/** Owns the currently visible consensus snapshot.
 *
 *  The slot is swapped atomically; readers keep whatever snapshot they
 *  obtained alive for as long as they hold it. Only one writer is expected,
 *  the store itself does not serialize writers.
 */
class UtxoStore
{
private:
    std::shared_ptr<const UtxoSnapshot> current_;

public:
    UtxoStore();

    void publish(std::shared_ptr<const UtxoSnapshot> snapshot);
    std::shared_ptr<const UtxoSnapshot> current() const;
    OverlayUtxoView overlay(const PendingLedger& pendingLedger) const;
};
#endif// UTXO_STORE_H
