// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BITCOIN_PRIMITIVES_TRANSACTION_H
#define BITCOIN_PRIMITIVES_TRANSACTION_H

#include <amount.h>
#include <OutPoint.h>
#include <ScriptPublicKey.h>
#include <uint256.h>

#include <array>
#include <stdint.h>
#include <string>
#include <vector>

typedef std::array<unsigned char, 20> SubnetworkId;

/** An input of a transaction. It contains the location of the previous
 * transaction's output that it claims and a signature that matches the
 * output's public key.
 */
class CTxIn
{
public:
    COutPoint prevout;
    std::vector<unsigned char> signatureScript;
    uint64_t nSequence;
    uint8_t sigOpCount;

    CTxIn();
    explicit CTxIn(const COutPoint& prevoutIn, uint8_t sigOpCountIn = 1);

    friend bool operator==(const CTxIn& a, const CTxIn& b);
    std::string ToString() const;
};

/** An output of a transaction. It contains the value and the
 * locking script that must be satisfied to spend it.
 */
class CTxOut
{
public:
    CAmount nValue;
    ScriptPublicKey scriptPubKey;

    CTxOut();
    CTxOut(const CAmount& nValueIn, const ScriptPublicKey& scriptPubKeyIn);

    friend bool operator==(const CTxOut& a, const CTxOut& b);
    std::string ToString() const;
};

struct CMutableTransaction;

/** The basic transaction that is broadcasted on the network.
 *  Immutable; its id is computed once on construction. The id never
 *  commits to signature scripts, so it is stable across signing.
 */
class CTransaction
{
private:
    uint256 hash;
    void UpdateHash();

public:
    uint16_t nVersion;
    std::vector<CTxIn> vin;
    std::vector<CTxOut> vout;
    uint64_t nLockTime;
    SubnetworkId subnetworkId;
    uint64_t gas;
    std::vector<unsigned char> payload;

    CTransaction();
    explicit CTransaction(const CMutableTransaction& tx);

    const uint256& GetHash() const { return hash; }
    CAmount GetValueOut() const;
    std::string ToString() const;
};

/** A mutable version of CTransaction. */
struct CMutableTransaction
{
    uint16_t nVersion;
    std::vector<CTxIn> vin;
    std::vector<CTxOut> vout;
    uint64_t nLockTime;
    SubnetworkId subnetworkId;
    uint64_t gas;
    std::vector<unsigned char> payload;

    CMutableTransaction();
    explicit CMutableTransaction(const CTransaction& tx);

    /** Compute the id of this CMutableTransaction. This is computed on the
     * fly, as opposed to GetHash() in CTransaction, which uses a cached result.
     */
    uint256 GetHash() const;
};

#endif // BITCOIN_PRIMITIVES_TRANSACTION_H
