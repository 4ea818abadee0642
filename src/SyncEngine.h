#ifndef SYNC_ENGINE_H
#define SYNC_ENGINE_H
#include <NodeRpcTypes.h>
#include <OverlayUtxoView.h>

#include <atomic>
#include <memory>
#include <stdint.h>
#include <vector>

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

class I_AddressDirectory;
class I_NodeClient;
class PendingLedger;
class UtxoSnapshot;
class UtxoStore;

enum class SyncCycleResult
{
    SYNCED,
    SKIPPED_IN_PROGRESS,
    FETCH_FAILED,
    UNRESOLVABLE_OWNER,
    NO_TRIGGER,
};

struct SyncCycleStatistics
{
    size_t consensusEntries;
    size_t mempoolEntries;
    size_t malformedEntries;
    size_t excludedEntries;
    size_t publishedUtxos;

    SyncCycleStatistics(
        ): consensusEntries(0u)
        , mempoolEntries(0u)
        , malformedEntries(0u)
        , excludedEntries(0u)
        , publishedUtxos(0u)
    {
    }
};

/** The only writer of the UTXO store.
 *
 *  A cycle fetches the wallet's consensus and mempool UTXOs, builds a new
 *  snapshot with nothing locked, publishes it and prunes the pending ledger.
 *  Cycles never overlap: a cycle requested while another runs is refused,
 *  and triggers raised meanwhile collapse into a single follow-up cycle.
 */
class SyncEngine
{
private:
    const I_AddressDirectory& addressDirectory_;
    const I_NodeClient& nodeClient_;
    UtxoStore& utxoStore_;
    PendingLedger& pendingLedger_;

    std::atomic<bool> cycleInProgress_;
    std::atomic<bool> synced_;
    // Only touched by the holder of cycleInProgress_
    uint64_t nextGeneration_;
    OutPointSet mempoolSpentOutPoints_;

    boost::mutex cs_triggers;
    boost::condition_variable triggerCondition_;
    bool syncRequested_;
    std::vector<UtxosChangedNotification> pendingNotifications_;
    int64_t lastFullSyncMillis_;

    bool TryBeginCycle();
    void EndCycle();
    SyncCycleResult RunFullCycle();
    SyncCycleResult ApplyNotifications(const std::vector<UtxosChangedNotification>& notifications);
    void PublishAndPrune(const std::shared_ptr<const UtxoSnapshot>& snapshot);

public:
    SyncEngine(
        const I_AddressDirectory& addressDirectory,
        const I_NodeClient& nodeClient,
        UtxoStore& utxoStore,
        PendingLedger& pendingLedger);

    /** Runs one full refresh now, unless one is already running */
    SyncCycleResult RunSyncCycle();
    /** Asks the sync thread for a full refresh as soon as possible */
    void RequestSync();
    /** Queues a change notification; applied without refetching when synced */
    void NotifyUtxosChanged(const UtxosChangedNotification& notification);

    /** Waits until a trigger fires or the interval elapses, then runs at most one cycle */
    SyncCycleResult ProcessNextTrigger(int64_t syncIntervalMillis);
    void ThreadSyncLoop(int64_t syncIntervalMillis);

    bool IsSynced() const;
};
#endif// SYNC_ENGINE_H
