// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <primitives/transaction.h>

#include <defaultValues.h>
#include <hash.h>
#include <Logging.h>
#include <tinyformat.h>
#include <utilstrencodings.h>

namespace
{
template <typename Transaction>
uint256 ComputeTransactionId(const Transaction& tx)
{
    CHashWriter hasher("TransactionID");
    hasher.WriteU16(tx.nVersion);
    hasher.WriteU64(tx.vin.size());
    for (const CTxIn& input: tx.vin)
    {
        hasher.write(input.prevout.hash.begin(), input.prevout.hash.size());
        hasher.WriteU32(input.prevout.n);
        hasher.WriteVarBytes(std::vector<unsigned char>());
        hasher.WriteU64(input.nSequence);
    }
    hasher.WriteU64(tx.vout.size());
    for (const CTxOut& output: tx.vout)
    {
        hasher.WriteU64(output.nValue);
        hasher.WriteU16(output.scriptPubKey.version);
        hasher.WriteVarBytes(output.scriptPubKey.script);
    }
    hasher.WriteU64(tx.nLockTime);
    hasher.write(tx.subnetworkId.data(), tx.subnetworkId.size());
    hasher.WriteU64(tx.gas);
    hasher.WriteVarBytes(tx.payload);
    return hasher.GetHash();
}

SubnetworkId NativeSubnetwork()
{
    SubnetworkId subnetwork;
    subnetwork.fill(0u);
    return subnetwork;
}
} // anonymous namespace

CTxIn::CTxIn(
    ): prevout()
    , signatureScript()
    , nSequence(DEFAULT_INPUT_SEQUENCE)
    , sigOpCount(1u)
{
}

CTxIn::CTxIn(
    const COutPoint& prevoutIn,
    uint8_t sigOpCountIn
    ): prevout(prevoutIn)
    , signatureScript()
    , nSequence(DEFAULT_INPUT_SEQUENCE)
    , sigOpCount(sigOpCountIn)
{
}

bool operator==(const CTxIn& a, const CTxIn& b)
{
    return a.prevout == b.prevout &&
        a.signatureScript == b.signatureScript &&
        a.nSequence == b.nSequence &&
        a.sigOpCount == b.sigOpCount;
}

std::string CTxIn::ToString() const
{
    std::string str;
    str += "CTxIn(";
    str += prevout.ToString();
    if (!signatureScript.empty())
        str += tfm::format(", signatureScript=%s", HexStr(signatureScript).substr(0, 24));
    str += tfm::format(", sigOpCount=%u)", static_cast<unsigned>(sigOpCount));
    return str;
}

CTxOut::CTxOut(
    ): nValue(0)
    , scriptPubKey()
{
}

CTxOut::CTxOut(
    const CAmount& nValueIn,
    const ScriptPublicKey& scriptPubKeyIn
    ): nValue(nValueIn)
    , scriptPubKey(scriptPubKeyIn)
{
}

bool operator==(const CTxOut& a, const CTxOut& b)
{
    return a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey;
}

std::string CTxOut::ToString() const
{
    return tfm::format("CTxOut(nValue=%s, scriptPubKey=%s)", FormatMoney(nValue), scriptPubKey.ToString().substr(0, 30));
}

CMutableTransaction::CMutableTransaction(
    ): nVersion(DEFAULT_TRANSACTION_VERSION)
    , vin()
    , vout()
    , nLockTime(0)
    , subnetworkId(NativeSubnetwork())
    , gas(0)
    , payload()
{
}

CMutableTransaction::CMutableTransaction(
    const CTransaction& tx
    ): nVersion(tx.nVersion)
    , vin(tx.vin)
    , vout(tx.vout)
    , nLockTime(tx.nLockTime)
    , subnetworkId(tx.subnetworkId)
    , gas(tx.gas)
    , payload(tx.payload)
{
}

uint256 CMutableTransaction::GetHash() const
{
    return ComputeTransactionId(*this);
}

CTransaction::CTransaction(
    ): hash()
    , nVersion(DEFAULT_TRANSACTION_VERSION)
    , vin()
    , vout()
    , nLockTime(0)
    , subnetworkId(NativeSubnetwork())
    , gas(0)
    , payload()
{
    UpdateHash();
}

CTransaction::CTransaction(
    const CMutableTransaction& tx
    ): hash()
    , nVersion(tx.nVersion)
    , vin(tx.vin)
    , vout(tx.vout)
    , nLockTime(tx.nLockTime)
    , subnetworkId(tx.subnetworkId)
    , gas(tx.gas)
    , payload(tx.payload)
{
    UpdateHash();
}

void CTransaction::UpdateHash()
{
    hash = ComputeTransactionId(*this);
}

CAmount CTransaction::GetValueOut() const
{
    CAmount nValueOut = 0;
    for (const CTxOut& out: vout)
    {
        nValueOut += out.nValue;
    }
    return nValueOut;
}

std::string CTransaction::ToString() const
{
    std::string str;
    str += tfm::format("CTransaction(hash=%s, ver=%d, vin.size=%u, vout.size=%u, nLockTime=%u)\n",
        GetHash().ToString().substr(0, 10),
        nVersion,
        vin.size(),
        vout.size(),
        nLockTime);
    for (unsigned int i = 0; i < vin.size(); i++)
        str += "    " + vin[i].ToString() + "\n";
    for (unsigned int i = 0; i < vout.size(); i++)
        str += "    " + vout[i].ToString() + "\n";
    return str;
}

LOG_FORMAT_WITH_TOSTRING(CTransaction)
