#include <SyncEngine.h>

#include <I_AddressDirectory.h>
#include <I_NodeClient.h>
#include <Logging.h>
#include <PendingLedger.h>
#include <UtxoSnapshot.h>
#include <UtxoSnapshotBuilder.h>
#include <UtxoStore.h>
#include <utiltime.h>

#include <algorithm>

#include <boost/thread/thread.hpp>

namespace
{
bool IsWellFormed(const RpcUtxoEntry& entry)
{
    return entry.address && entry.outpoint && entry.utxoEntry;
}

OutPointSet CollectMempoolSpends(const std::vector<RpcMempoolEntriesByAddress>& mempoolEntries)
{
    OutPointSet spentOutPoints;
    for (const RpcMempoolEntriesByAddress& entriesByAddress: mempoolEntries)
    {
        for (const RpcMempoolEntry& sendingEntry: entriesByAddress.sending)
        {
            for (const RpcTransactionInput& input: sendingEntry.transaction.inputs)
            {
                if (input.previousOutpoint)
                    spentOutPoints.insert(*input.previousOutpoint);
            }
        }
    }
    return spentOutPoints;
}

void AddMempoolReceivingOutputs(
    const std::vector<RpcMempoolEntriesByAddress>& mempoolEntries,
    const VersionedAddressOwnerMap& ownerMap,
    const OutPointSet& spentOutPoints,
    UtxoSnapshotBuilder& builder,
    SyncCycleStatistics& statistics)
{
    for (const RpcMempoolEntriesByAddress& entriesByAddress: mempoolEntries)
    {
        for (const RpcMempoolEntry& receivingEntry: entriesByAddress.receiving)
        {
            ++statistics.mempoolEntries;
            const RpcMempoolTransaction& transaction = receivingEntry.transaction;
            if (!transaction.transactionId)
            {
                ++statistics.malformedEntries;
                continue;
            }
            for (unsigned outputIndex = 0; outputIndex < transaction.outputs.size(); ++outputIndex)
            {
                const RpcTransactionOutput& output = transaction.outputs[outputIndex];
                if (!output.address)
                    continue;
                const auto owner = ownerMap.ownerByAddress.find(*output.address);
                if (owner == ownerMap.ownerByAddress.end())
                    continue;
                const COutPoint outpoint(*transaction.transactionId, outputIndex);
                if (spentOutPoints.count(outpoint) > 0)
                {
                    ++statistics.excludedEntries;
                    continue;
                }
                // Already known from consensus or from another address's listing
                builder.AddUtxo(WalletUtxo(outpoint, UtxoEntry(output.value, output.scriptPublicKey, 0u, false), owner->second));
            }
        }
    }
}
} // anonymous namespace

SyncEngine::SyncEngine(
    const I_AddressDirectory& addressDirectory,
    const I_NodeClient& nodeClient,
    UtxoStore& utxoStore,
    PendingLedger& pendingLedger
    ): addressDirectory_(addressDirectory)
    , nodeClient_(nodeClient)
    , utxoStore_(utxoStore)
    , pendingLedger_(pendingLedger)
    , cycleInProgress_(false)
    , synced_(false)
    , nextGeneration_(1u)
    , mempoolSpentOutPoints_()
    , cs_triggers()
    , triggerCondition_()
    , syncRequested_(false)
    , pendingNotifications_()
    , lastFullSyncMillis_(0)
{
}

bool SyncEngine::TryBeginCycle()
{
    bool expected = false;
    return cycleInProgress_.compare_exchange_strong(expected, true);
}

void SyncEngine::EndCycle()
{
    cycleInProgress_.store(false);
    boost::unique_lock<boost::mutex> lock(cs_triggers);
    triggerCondition_.notify_all();
}

SyncCycleResult SyncEngine::RunSyncCycle()
{
    if (!TryBeginCycle())
    {
        LogPrint("sync", "%s: a cycle is already running, skipped\n", __func__);
        return SyncCycleResult::SKIPPED_IN_PROGRESS;
    }
    SyncCycleResult result = SyncCycleResult::FETCH_FAILED;
    try
    {
        result = RunFullCycle();
    }
    catch (...)
    {
        EndCycle();
        throw;
    }
    EndCycle();
    return result;
}

SyncCycleResult SyncEngine::RunFullCycle()
{
    const int64_t startMillis = GetTimeMillis();
    const std::shared_ptr<const VersionedAddressList> monitoredAddresses = addressDirectory_.GetMonitoredAddresses();
    const std::shared_ptr<const VersionedAddressOwnerMap> ownerMap = addressDirectory_.GetAddressOwnerMap();

    // Mempool first: an output accepted in between is then found in consensus
    std::string errorMessage;
    std::vector<RpcMempoolEntriesByAddress> mempoolEntries;
    if (!nodeClient_.GetMempoolEntriesByAddresses(monitoredAddresses->addresses, mempoolEntries, errorMessage))
    {
        error("%s: mempool fetch failed, keeping previous snapshot: %s", __func__, errorMessage);
        return SyncCycleResult::FETCH_FAILED;
    }
    std::vector<RpcUtxoEntry> utxoEntries;
    if (!nodeClient_.GetUtxosByAddresses(monitoredAddresses->addresses, utxoEntries, errorMessage))
    {
        error("%s: utxo fetch failed, keeping previous snapshot: %s", __func__, errorMessage);
        return SyncCycleResult::FETCH_FAILED;
    }
    uint64_t virtualDaaScore = 0u;
    if (!nodeClient_.GetVirtualDaaScore(virtualDaaScore, errorMessage))
    {
        error("%s: virtual DAA score fetch failed, keeping previous snapshot: %s", __func__, errorMessage);
        return SyncCycleResult::FETCH_FAILED;
    }

    SyncCycleStatistics statistics;
    OutPointSet spentOutPoints = CollectMempoolSpends(mempoolEntries);
    UtxoSnapshotBuilder builder;
    for (const RpcUtxoEntry& entry: utxoEntries)
    {
        ++statistics.consensusEntries;
        if (!IsWellFormed(entry))
        {
            ++statistics.malformedEntries;
            continue;
        }
        if (spentOutPoints.count(*entry.outpoint) > 0)
        {
            ++statistics.excludedEntries;
            continue;
        }
        const auto owner = ownerMap->ownerByAddress.find(*entry.address);
        if (owner == ownerMap->ownerByAddress.end())
        {
            error("%s: UTXO address %s not found in wallet address set (directory version %u), cycle aborted",
                __func__, *entry.address, ownerMap->version);
            return SyncCycleResult::UNRESOLVABLE_OWNER;
        }
        if (!builder.AddUtxo(WalletUtxo(*entry.outpoint, *entry.utxoEntry, owner->second)))
        {
            LogPrint("sync", "%s: duplicate entry for %s ignored\n", __func__, *entry.outpoint);
        }
    }
    AddMempoolReceivingOutputs(mempoolEntries, *ownerMap, spentOutPoints, builder, statistics);

    const std::shared_ptr<const UtxoSnapshot> snapshot = builder.Build(nextGeneration_++, virtualDaaScore);
    statistics.publishedUtxos = snapshot->size();
    mempoolSpentOutPoints_.swap(spentOutPoints);
    PublishAndPrune(snapshot);

    if (!synced_.exchange(true))
        LogPrintf("%s: first sync done, %u utxos\n", __func__, statistics.publishedUtxos);
    LogPrint("sync", "%s: %u consensus entries, %u mempool entries, %u malformed, %u excluded, %u published in %d ms\n",
        __func__,
        statistics.consensusEntries,
        statistics.mempoolEntries,
        statistics.malformedEntries,
        statistics.excludedEntries,
        statistics.publishedUtxos,
        GetTimeMillis() - startMillis);
    return SyncCycleResult::SYNCED;
}

SyncCycleResult SyncEngine::ApplyNotifications(const std::vector<UtxosChangedNotification>& notifications)
{
    std::string errorMessage;
    uint64_t virtualDaaScore = 0u;
    if (!nodeClient_.GetVirtualDaaScore(virtualDaaScore, errorMessage))
    {
        error("%s: virtual DAA score fetch failed, keeping previous snapshot: %s", __func__, errorMessage);
        return SyncCycleResult::FETCH_FAILED;
    }

    const std::shared_ptr<const VersionedAddressOwnerMap> ownerMap = addressDirectory_.GetAddressOwnerMap();
    const std::shared_ptr<const UtxoSnapshot> currentSnapshot = utxoStore_.current();
    UtxoSnapshotBuilder builder(*currentSnapshot);
    size_t removedCount = 0u;
    size_t addedCount = 0u;
    for (const UtxosChangedNotification& notification: notifications)
    {
        for (const RpcUtxoEntry& removed: notification.removed)
        {
            if (removed.outpoint && builder.RemoveUtxo(*removed.outpoint))
                ++removedCount;
        }
        for (const RpcUtxoEntry& added: notification.added)
        {
            if (!IsWellFormed(added) || mempoolSpentOutPoints_.count(*added.outpoint) > 0)
                continue;
            const auto owner = ownerMap->ownerByAddress.find(*added.address);
            if (owner == ownerMap->ownerByAddress.end())
            {
                error("%s: UTXO address %s not found in wallet address set (directory version %u), update aborted",
                    __func__, *added.address, ownerMap->version);
                return SyncCycleResult::UNRESOLVABLE_OWNER;
            }
            // A mempool output turning into a consensus output replaces the provisional entry
            builder.RemoveUtxo(*added.outpoint);
            builder.AddUtxo(WalletUtxo(*added.outpoint, *added.utxoEntry, owner->second));
            ++addedCount;
        }
    }

    PublishAndPrune(builder.Build(nextGeneration_++, virtualDaaScore));
    LogPrint("sync", "%s: applied %u notifications, %u added, %u removed\n", __func__, notifications.size(), addedCount, removedCount);
    return SyncCycleResult::SYNCED;
}

void SyncEngine::PublishAndPrune(const std::shared_ptr<const UtxoSnapshot>& snapshot)
{
    utxoStore_.publish(snapshot);
    const unsigned prunedCount = pendingLedger_.prune(*snapshot);
    if (prunedCount > 0)
        LogPrint("sync", "%s: %u pending transactions confirmed\n", __func__, prunedCount);
}

void SyncEngine::RequestSync()
{
    boost::unique_lock<boost::mutex> lock(cs_triggers);
    syncRequested_ = true;
    triggerCondition_.notify_one();
}

void SyncEngine::NotifyUtxosChanged(const UtxosChangedNotification& notification)
{
    boost::unique_lock<boost::mutex> lock(cs_triggers);
    pendingNotifications_.push_back(notification);
    triggerCondition_.notify_one();
}

SyncCycleResult SyncEngine::ProcessNextTrigger(int64_t syncIntervalMillis)
{
    bool runFullCycle = false;
    std::vector<UtxosChangedNotification> notifications;
    {
        boost::unique_lock<boost::mutex> lock(cs_triggers);
        const int64_t waitMillis = lastFullSyncMillis_ + syncIntervalMillis - GetTimeMillis();
        // EndCycle notifies under cs_triggers, so a cycle ending here is not missed
        if (cycleInProgress_.load())
            triggerCondition_.wait_for(lock, boost::chrono::milliseconds(syncIntervalMillis));
        else if (!syncRequested_ && pendingNotifications_.empty() && waitMillis > 0)
            triggerCondition_.wait_for(lock, boost::chrono::milliseconds(waitMillis));

        runFullCycle = syncRequested_ || !IsSynced() || GetTimeMillis() >= lastFullSyncMillis_ + syncIntervalMillis;
        syncRequested_ = false;
        notifications.swap(pendingNotifications_);
        if (runFullCycle)
            lastFullSyncMillis_ = GetTimeMillis();
    }

    // A full refetch already reflects every queued change
    if (runFullCycle)
    {
        const SyncCycleResult result = RunSyncCycle();
        if (result == SyncCycleResult::SKIPPED_IN_PROGRESS)
        {
            boost::unique_lock<boost::mutex> lock(cs_triggers);
            syncRequested_ = true;
        }
        return result;
    }
    if (notifications.empty())
        return SyncCycleResult::NO_TRIGGER;

    if (!TryBeginCycle())
    {
        boost::unique_lock<boost::mutex> lock(cs_triggers);
        pendingNotifications_.insert(pendingNotifications_.begin(), notifications.begin(), notifications.end());
        return SyncCycleResult::SKIPPED_IN_PROGRESS;
    }
    SyncCycleResult result = SyncCycleResult::FETCH_FAILED;
    try
    {
        result = ApplyNotifications(notifications);
    }
    catch (...)
    {
        EndCycle();
        throw;
    }
    EndCycle();
    if (result != SyncCycleResult::SYNCED)
        RequestSync();
    return result;
}

void SyncEngine::ThreadSyncLoop(int64_t syncIntervalMillis)
{
    while (true)
    {
        boost::this_thread::interruption_point();
        ProcessNextTrigger(syncIntervalMillis);
    }
}

bool SyncEngine::IsSynced() const
{
    return synced_.load();
}
