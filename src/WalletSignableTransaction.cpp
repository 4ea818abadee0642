#include <WalletSignableTransaction.h>

#include <defaultValues.h>

#include <cassert>

WalletSignableTransaction::WalletSignableTransaction(
    const CTransaction& transaction,
    const std::vector<UtxoEntry>& spentEntries,
    const std::vector<WalletAddress>& addressByInputIndex,
    const std::map<unsigned, WalletAddress>& addressByOutputIndex
    ): transaction_(transaction)
    , spentEntries_(spentEntries)
    , addressByInputIndex_(addressByInputIndex)
    , addressByOutputIndex_(addressByOutputIndex)
{
    assert(spentEntries_.size() == transaction_.vin.size());
    assert(addressByInputIndex_.size() == transaction_.vin.size());
}

std::vector<COutPoint> WalletSignableTransaction::GetConsumedOutPoints() const
{
    std::vector<COutPoint> outpoints;
    outpoints.reserve(transaction_.vin.size());
    for (const CTxIn& input: transaction_.vin)
    {
        outpoints.push_back(input.prevout);
    }
    return outpoints;
}

std::vector<WalletUtxo> WalletSignableTransaction::GetWalletOwnedOutputs() const
{
    std::vector<WalletUtxo> ownedOutputs;
    for (const auto& indexAndAddress: addressByOutputIndex_)
    {
        const unsigned outputIndex = indexAndAddress.first;
        assert(outputIndex < transaction_.vout.size());
        const CTxOut& output = transaction_.vout[outputIndex];
        ownedOutputs.emplace_back(
            COutPoint(transaction_.GetHash(), outputIndex),
            UtxoEntry(output.nValue, output.scriptPubKey, UNACCEPTED_DAA_SCORE, false),
            indexAndAddress.second);
    }
    return ownedOutputs;
}

std::set<WalletAddress> WalletSignableTransaction::GetSigningAddresses() const
{
    return std::set<WalletAddress>(addressByInputIndex_.begin(), addressByInputIndex_.end());
}

CAmount WalletSignableTransaction::GetValueIn() const
{
    CAmount valueIn = 0;
    for (const UtxoEntry& entry: spentEntries_)
    {
        valueIn += entry.amount;
    }
    return valueIn;
}

CAmount WalletSignableTransaction::GetFee() const
{
    const CAmount valueOut = transaction_.GetValueOut();
    const CAmount valueIn = GetValueIn();
    return valueIn >= valueOut ? valueIn - valueOut : 0;
}
