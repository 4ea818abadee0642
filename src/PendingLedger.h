#ifndef PENDING_LEDGER_H
#define PENDING_LEDGER_H
#include <WalletSignableTransaction.h>
#include <sync.h>

#include <memory>
#include <vector>

class UtxoSnapshot;
typedef std::shared_ptr<const WalletSignableTransaction> PendingTransactionReference;

/** Transactions this wallet broadcast that consensus does not reflect yet */
class PendingLedger
{
private:
    mutable CCriticalSection cs_ledger;
    std::vector<PendingTransactionReference> pendingTransactions_;

public:
    PendingLedger();

    /** Returns false if a transaction with the same id is already recorded */
    bool add(const PendingTransactionReference& pendingTransaction);
    /** Drops every transaction that spends an input missing from the snapshot.
     *  Returns the number of dropped transactions. */
    unsigned prune(const UtxoSnapshot& freshSnapshot);

    std::vector<PendingTransactionReference> GetPendingTransactions() const;
    size_t size() const;
};
#endif// PENDING_LEDGER_H
