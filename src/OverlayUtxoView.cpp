#include <OverlayUtxoView.h>

#include <algorithm>
#include <cassert>

OverlayUtxoView::OverlayUtxoView(
    std::shared_ptr<const UtxoSnapshot> snapshot,
    const std::vector<PendingTransactionReference>& pendingTransactions
    ): snapshot_(snapshot)
    , excludedOutPoints_()
    , additions_()
{
    assert(snapshot_);
    for (const PendingTransactionReference& pendingTransaction: pendingTransactions)
    {
        const std::vector<COutPoint> consumed = pendingTransaction->GetConsumedOutPoints();
        excludedOutPoints_.insert(consumed.begin(), consumed.end());
        for (const WalletUtxo& output: pendingTransaction->GetWalletOwnedOutputs())
        {
            additions_.insert(std::make_pair(output.outpoint(), output));
        }
    }
    // A pending output spent by a later pending transaction is gone as well
    for (const COutPoint& excluded: excludedOutPoints_)
    {
        additions_.erase(excluded);
    }
}

bool OverlayUtxoView::Contains(const COutPoint& outpoint) const
{
    return GetUtxo(outpoint) != nullptr;
}

const WalletUtxo* OverlayUtxoView::GetUtxo(const COutPoint& outpoint) const
{
    if (excludedOutPoints_.count(outpoint) > 0)
        return nullptr;
    const auto addition = additions_.find(outpoint);
    if (addition != additions_.end())
        return &addition->second;
    return snapshot_->GetUtxo(outpoint);
}

void OverlayUtxoView::ForEachSortedByAmount(const UtxoVisitor& visitor) const
{
    if (excludedOutPoints_.empty())
    {
        snapshot_->ForEachSortedByAmount(visitor);
        return;
    }
    const OutPointSet& excluded = excludedOutPoints_;
    snapshot_->ForEachSortedByAmount(
        [&excluded, &visitor](const WalletUtxo& utxo)
        {
            if (excluded.count(utxo.outpoint()) > 0)
                return true;
            return visitor(utxo);
        });
}

std::vector<WalletUtxo> OverlayUtxoView::GetPendingAdditions() const
{
    std::vector<WalletUtxo> pendingAdditions;
    pendingAdditions.reserve(additions_.size());
    for (const auto& outpointAndUtxo: additions_)
    {
        pendingAdditions.push_back(outpointAndUtxo.second);
    }
    std::sort(pendingAdditions.begin(), pendingAdditions.end(),
        [](const WalletUtxo& a, const WalletUtxo& b)
        {
            return std::make_pair(a.amount(), a.outpoint()) < std::make_pair(b.amount(), b.outpoint());
        });
    return pendingAdditions;
}

bool OverlayUtxoView::IsEmpty() const
{
    if (!additions_.empty())
        return false;
    if (snapshot_->IsEmpty())
        return true;
    if (excludedOutPoints_.size() < snapshot_->size())
        return false;
    for (const auto& outpointAndUtxo: snapshot_->GetUtxosByOutPoint())
    {
        if (excludedOutPoints_.count(outpointAndUtxo.first) == 0)
            return false;
    }
    return true;
}

uint64_t OverlayUtxoView::GetVirtualDaaScore() const
{
    return snapshot_->GetVirtualDaaScore();
}
