#ifndef TRANSACTION_SUBMITTER_H
#define TRANSACTION_SUBMITTER_H
#include <uint256.h>
#include <WalletError.h>
#include <WalletSignableTransaction.h>

#include <string>
#include <vector>

class I_NodeClient;
class PendingLedger;

struct TransactionSubmissionResult
{
    std::vector<uint256> transactionIds;
    WalletErrorKind errorKind;
    std::string errorMessage;

    TransactionSubmissionResult(
        ): transactionIds()
        , errorKind(WalletErrorKind::NONE)
        , errorMessage()
    {
    }
    bool succeeded() const { return errorKind == WalletErrorKind::NONE; }
};

/** Broadcasts signed transactions in order. Each accepted transaction is
 *  recorded as pending before the next one is sent, so a merge chain is
 *  accounted for even if a later link is refused. */
class TransactionSubmitter
{
private:
    const I_NodeClient& nodeClient_;
    PendingLedger& pendingLedger_;

public:
    TransactionSubmitter(
        const I_NodeClient& nodeClient,
        PendingLedger& pendingLedger);

    TransactionSubmissionResult SubmitTransactions(
        const std::vector<WalletSignableTransaction>& signedTransactions) const;
};
#endif// TRANSACTION_SUBMITTER_H
