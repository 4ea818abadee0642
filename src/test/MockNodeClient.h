#ifndef MOCK_NODE_CLIENT_H
#define MOCK_NODE_CLIENT_H
#include <I_NodeClient.h>
#include <primitives/transaction.h>
#include <gmock/gmock.h>

class MockNodeClient: public I_NodeClient
{
public:
    MOCK_CONST_METHOD3(GetUtxosByAddresses, bool(const std::vector<std::string>& addresses, std::vector<RpcUtxoEntry>& entries, std::string& errorMessage));
    MOCK_CONST_METHOD3(GetMempoolEntriesByAddresses, bool(const std::vector<std::string>& addresses, std::vector<RpcMempoolEntriesByAddress>& entries, std::string& errorMessage));
    MOCK_CONST_METHOD2(GetVirtualDaaScore, bool(uint64_t& virtualDaaScore, std::string& errorMessage));
    MOCK_CONST_METHOD2(GetFeeEstimate, bool(double& feeRate, std::string& errorMessage));
    MOCK_CONST_METHOD3(SubmitTransaction, bool(const CTransaction& transaction, uint256& transactionId, std::string& errorMessage));
};
#endif// MOCK_NODE_CLIENT_H
