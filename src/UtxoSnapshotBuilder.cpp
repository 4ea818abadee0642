#include <UtxoSnapshotBuilder.h>

#include <algorithm>

UtxoSnapshotBuilder::UtxoSnapshotBuilder(
    ): utxosByOutPoint_()
{
}

UtxoSnapshotBuilder::UtxoSnapshotBuilder(
    const UtxoSnapshot& baseSnapshot
    ): utxosByOutPoint_(baseSnapshot.GetUtxosByOutPoint())
{
}

bool UtxoSnapshotBuilder::AddUtxo(const WalletUtxo& utxo)
{
    return utxosByOutPoint_.insert(std::make_pair(utxo.outpoint(), utxo)).second;
}

bool UtxoSnapshotBuilder::RemoveUtxo(const COutPoint& outpoint)
{
    return utxosByOutPoint_.erase(outpoint) > 0;
}

bool UtxoSnapshotBuilder::Contains(const COutPoint& outpoint) const
{
    return utxosByOutPoint_.count(outpoint) > 0;
}

size_t UtxoSnapshotBuilder::size() const
{
    return utxosByOutPoint_.size();
}

std::shared_ptr<const UtxoSnapshot> UtxoSnapshotBuilder::Build(uint64_t generation, uint64_t virtualDaaScore)
{
    std::vector<AmountAndOutPoint> sortedByAmount;
    sortedByAmount.reserve(utxosByOutPoint_.size());
    for (const auto& outpointAndUtxo: utxosByOutPoint_)
    {
        sortedByAmount.emplace_back(outpointAndUtxo.second.amount(), outpointAndUtxo.first);
    }
    // Keys are unique, so the order is total and does not depend on hash map iteration order
    std::sort(sortedByAmount.begin(), sortedByAmount.end());

    UtxosByOutPoint utxosByOutPoint;
    utxosByOutPoint.swap(utxosByOutPoint_);
    return std::make_shared<const UtxoSnapshot>(
        generation,
        virtualDaaScore,
        std::move(utxosByOutPoint),
        std::move(sortedByAmount));
}
