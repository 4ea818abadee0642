#include <TransactionSubmitter.h>

#include <I_NodeClient.h>
#include <Logging.h>
#include <PendingLedger.h>

#include <memory>

TransactionSubmitter::TransactionSubmitter(
    const I_NodeClient& nodeClient,
    PendingLedger& pendingLedger
    ): nodeClient_(nodeClient)
    , pendingLedger_(pendingLedger)
{
}

TransactionSubmissionResult TransactionSubmitter::SubmitTransactions(
    const std::vector<WalletSignableTransaction>& signedTransactions) const
{
    TransactionSubmissionResult result;
    for (const WalletSignableTransaction& signedTransaction: signedTransactions)
    {
        uint256 transactionId;
        std::string nodeError;
        if (!nodeClient_.SubmitTransaction(signedTransaction.transaction(), transactionId, nodeError))
        {
            result.errorKind = WalletErrorKind::SUBMISSION_REJECTED;
            result.errorMessage = tfm::format("Transaction %s was rejected after %u accepted: %s",
                signedTransaction.GetHash().ToString(), result.transactionIds.size(), nodeError);
            error("%s: %s", __func__, result.errorMessage);
            return result;
        }
        if (transactionId != signedTransaction.GetHash())
            LogPrintf("%s: node reported id %s for transaction %s\n", __func__, transactionId, signedTransaction.GetHash());
        if (!pendingLedger_.add(std::make_shared<const WalletSignableTransaction>(signedTransaction)))
            LogPrint("ledger", "%s: %s was already pending\n", __func__, signedTransaction.GetHash());
        result.transactionIds.push_back(transactionId);
    }
    LogPrint("ledger", "%s: submitted %u transactions\n", __func__, result.transactionIds.size());
    return result;
}
