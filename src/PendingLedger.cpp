#include <PendingLedger.h>

#include <Logging.h>
#include <UtxoSnapshot.h>

#include <algorithm>

PendingLedger::PendingLedger(
    ): cs_ledger()
    , pendingTransactions_()
{
}

bool PendingLedger::add(const PendingTransactionReference& pendingTransaction)
{
    LOCK(cs_ledger);
    for (const PendingTransactionReference& recorded: pendingTransactions_)
    {
        if (recorded->GetHash() == pendingTransaction->GetHash())
            return false;
    }
    pendingTransactions_.push_back(pendingTransaction);
    LogPrint("ledger", "%s: recorded %s (%u pending)\n", __func__, pendingTransaction->GetHash(), pendingTransactions_.size());
    return true;
}

unsigned PendingLedger::prune(const UtxoSnapshot& freshSnapshot)
{
    LOCK(cs_ledger);
    const size_t sizeBefore = pendingTransactions_.size();
    const auto isConfirmed = [&freshSnapshot](const PendingTransactionReference& pendingTransaction)
    {
        for (const COutPoint& consumed: pendingTransaction->GetConsumedOutPoints())
        {
            if (!freshSnapshot.Contains(consumed))
            {
                LogPrint("ledger", "prune: %s no longer pending, input %s is gone\n",
                    pendingTransaction->GetHash(), consumed.ToString());
                return true;
            }
        }
        return false;
    };
    pendingTransactions_.erase(
        std::remove_if(pendingTransactions_.begin(), pendingTransactions_.end(), isConfirmed),
        pendingTransactions_.end());
    return static_cast<unsigned>(sizeBefore - pendingTransactions_.size());
}

std::vector<PendingTransactionReference> PendingLedger::GetPendingTransactions() const
{
    LOCK(cs_ledger);
    return pendingTransactions_;
}

size_t PendingLedger::size() const
{
    LOCK(cs_ledger);
    return pendingTransactions_.size();
}
