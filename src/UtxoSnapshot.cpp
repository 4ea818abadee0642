#include <UtxoSnapshot.h>

#include <cassert>

#if defined(NDEBUG)
#error "kaswallet cannot be compiled without assertions."
#endif

UtxoSnapshot::UtxoSnapshot(
    ): generation_(0u)
    , virtualDaaScore_(0u)
    , utxosByOutPoint_()
    , sortedByAmount_()
{
}

UtxoSnapshot::UtxoSnapshot(
    uint64_t generation,
    uint64_t virtualDaaScore,
    UtxosByOutPoint&& utxosByOutPoint,
    std::vector<AmountAndOutPoint>&& sortedByAmount
    ): generation_(generation)
    , virtualDaaScore_(virtualDaaScore)
    , utxosByOutPoint_(std::move(utxosByOutPoint))
    , sortedByAmount_(std::move(sortedByAmount))
{
    AssertIsConsistent();
}

void UtxoSnapshot::AssertIsConsistent() const
{
    assert(utxosByOutPoint_.size() == sortedByAmount_.size());
    for (size_t position = 0; position < sortedByAmount_.size(); ++position)
    {
        const AmountAndOutPoint& key = sortedByAmount_[position];
        if (position > 0)
        {
            assert(sortedByAmount_[position - 1] < key);
        }
        const auto it = utxosByOutPoint_.find(key.second);
        assert(it != utxosByOutPoint_.end());
        assert(it->second.amount() == key.first);
    }
}

bool UtxoSnapshot::Contains(const COutPoint& outpoint) const
{
    return utxosByOutPoint_.count(outpoint) > 0;
}

const WalletUtxo* UtxoSnapshot::GetUtxo(const COutPoint& outpoint) const
{
    const auto it = utxosByOutPoint_.find(outpoint);
    return it == utxosByOutPoint_.end() ? nullptr : &it->second;
}

void UtxoSnapshot::ForEachSortedByAmount(const UtxoVisitor& visitor) const
{
    for (const AmountAndOutPoint& key: sortedByAmount_)
    {
        if (!visitor(utxosByOutPoint_.find(key.second)->second))
            return;
    }
}

std::vector<WalletUtxo> UtxoSnapshot::GetPendingAdditions() const
{
    return std::vector<WalletUtxo>();
}

bool UtxoSnapshot::IsEmpty() const
{
    return utxosByOutPoint_.empty();
}

uint64_t UtxoSnapshot::GetVirtualDaaScore() const
{
    return virtualDaaScore_;
}
