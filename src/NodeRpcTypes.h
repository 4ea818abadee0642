#ifndef NODE_RPC_TYPES_H
#define NODE_RPC_TYPES_H
#include <amount.h>
#include <OutPoint.h>
#include <UtxoEntry.h>
#include <uint256.h>

#include <boost/optional.hpp>

#include <string>
#include <vector>

/** UTXO as reported by the node. Any field may be missing from a
 *  malformed response. */
struct RpcUtxoEntry
{
    boost::optional<std::string> address;
    boost::optional<COutPoint> outpoint;
    boost::optional<UtxoEntry> utxoEntry;
};

struct RpcTransactionInput
{
    boost::optional<COutPoint> previousOutpoint;
};

struct RpcTransactionOutput
{
    CAmount value;
    ScriptPublicKey scriptPublicKey;
    /** Only present when the node resolved the locking script to an address */
    boost::optional<std::string> address;
};

struct RpcMempoolTransaction
{
    boost::optional<uint256> transactionId;
    std::vector<RpcTransactionInput> inputs;
    std::vector<RpcTransactionOutput> outputs;
};

struct RpcMempoolEntry
{
    CAmount fee;
    bool isOrphan;
    RpcMempoolTransaction transaction;
};

struct RpcMempoolEntriesByAddress
{
    std::string address;
    /** Transactions spending from the address */
    std::vector<RpcMempoolEntry> sending;
    /** Transactions paying to the address */
    std::vector<RpcMempoolEntry> receiving;
};

/** Delta pushed by the node when UTXOs of subscribed addresses change */
struct UtxosChangedNotification
{
    std::vector<RpcUtxoEntry> added;
    std::vector<RpcUtxoEntry> removed;
};
#endif// NODE_RPC_TYPES_H
