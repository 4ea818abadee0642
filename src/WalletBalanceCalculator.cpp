#include <WalletBalanceCalculator.h>

#include <I_AddressDirectory.h>
#include <I_UtxoView.h>
#include <WalletUtxo.h>

#include <map>
#include <memory>

WalletBalanceCalculator::WalletBalanceCalculator(
    const I_AddressDirectory& addressDirectory,
    uint64_t coinbaseMaturity
    ): addressDirectory_(addressDirectory)
    , coinbaseMaturity_(coinbaseMaturity)
{
}

WalletBalances WalletBalanceCalculator::CalculateBalances(const I_UtxoView& view, bool perAddress) const
{
    WalletBalances balances;
    if (view.IsEmpty())
        return balances;

    std::shared_ptr<const VersionedAddressOwnerMap> ownerMap;
    if (perAddress)
        ownerMap = addressDirectory_.GetAddressOwnerMap();
    std::map<std::string, AddressBalance> balanceByAddress;
    const auto balanceForOwner = [&](const WalletAddress& owner) -> AddressBalance&
    {
        const auto known = ownerMap->addressByOwner.find(owner);
        const std::string address = known != ownerMap->addressByOwner.end() ? known->second : owner.ToString();
        auto it = balanceByAddress.find(address);
        if (it == balanceByAddress.end())
            it = balanceByAddress.insert(std::make_pair(address, AddressBalance(address))).first;
        return it->second;
    };

    const uint64_t virtualDaaScore = view.GetVirtualDaaScore();
    view.ForEachSortedByAmount(
        [&](const WalletUtxo& utxo) -> bool
        {
            const bool isPending = utxo.IsImmatureCoinbase(virtualDaaScore, coinbaseMaturity_);
            CAmount& total = isPending ? balances.pending : balances.available;
            total += utxo.amount();
            if (perAddress)
            {
                AddressBalance& addressBalance = balanceForOwner(utxo.address());
                (isPending ? addressBalance.pending : addressBalance.available) += utxo.amount();
            }
            return true;
        });
    for (const WalletUtxo& utxo: view.GetPendingAdditions())
    {
        balances.pending += utxo.amount();
        if (perAddress)
            balanceForOwner(utxo.address()).pending += utxo.amount();
    }

    balances.addressBalances.reserve(balanceByAddress.size());
    for (const auto& addressAndBalance: balanceByAddress)
    {
        balances.addressBalances.push_back(addressAndBalance.second);
    }
    return balances;
}
