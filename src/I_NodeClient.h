#ifndef I_NODE_CLIENT_H
#define I_NODE_CLIENT_H
#include <NodeRpcTypes.h>

#include <string>
#include <vector>

class CTransaction;

/** Requests served by the remote consensus node. Every call may block on
 *  the network and reports failure through errorMessage. */
class I_NodeClient
{
public:
    virtual ~I_NodeClient(){}
    virtual bool GetUtxosByAddresses(
        const std::vector<std::string>& addresses,
        std::vector<RpcUtxoEntry>& entries,
        std::string& errorMessage) const = 0;
    virtual bool GetMempoolEntriesByAddresses(
        const std::vector<std::string>& addresses,
        std::vector<RpcMempoolEntriesByAddress>& entries,
        std::string& errorMessage) const = 0;
    virtual bool GetVirtualDaaScore(
        uint64_t& virtualDaaScore,
        std::string& errorMessage) const = 0;
    /** Normal priority fee rate in sompi per gram */
    virtual bool GetFeeEstimate(
        double& feeRate,
        std::string& errorMessage) const = 0;
    virtual bool SubmitTransaction(
        const CTransaction& transaction,
        uint256& transactionId,
        std::string& errorMessage) const = 0;
};
#endif// I_NODE_CLIENT_H
