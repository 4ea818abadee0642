#include <UtxoListingCalculator.h>

#include <FeeRate.h>
#include <I_AddressDirectory.h>
#include <I_UtxoView.h>
#include <MassCalculator.h>

#include <map>
#include <memory>
#include <set>

UtxoListingCalculator::UtxoListingCalculator(
    const I_AddressDirectory& addressDirectory,
    const MassCalculator& massCalculator,
    uint64_t coinbaseMaturity
    ): addressDirectory_(addressDirectory)
    , massCalculator_(massCalculator)
    , coinbaseMaturity_(coinbaseMaturity)
{
}

std::vector<AddressUtxos> UtxoListingCalculator::ListUtxos(
    const I_UtxoView& view,
    const CFeeRate& feeRate,
    const std::vector<std::string>& addressFilter,
    bool includePending,
    bool includeDust) const
{
    std::vector<AddressUtxos> listing;
    if (view.IsEmpty())
        return listing;

    const std::shared_ptr<const VersionedAddressOwnerMap> ownerMap = addressDirectory_.GetAddressOwnerMap();
    const std::set<std::string> requestedAddresses(addressFilter.begin(), addressFilter.end());
    const CAmount spendingFee = feeRate.GetFee(massCalculator_.CalculateMassPerInput());
    const uint64_t virtualDaaScore = view.GetVirtualDaaScore();

    std::map<std::string, std::vector<ListedUtxo> > utxosByAddress;
    const auto addToListing = [&](const WalletUtxo& utxo, bool isPending)
    {
        if (isPending && !includePending)
            return;
        const bool isDust = utxo.amount() < spendingFee;
        if (isDust && !includeDust)
            return;
        const auto known = ownerMap->addressByOwner.find(utxo.address());
        const std::string address = known != ownerMap->addressByOwner.end() ? known->second : utxo.address().ToString();
        if (!requestedAddresses.empty() && requestedAddresses.count(address) == 0)
            return;
        utxosByAddress[address].emplace_back(utxo, isPending, isDust);
    };

    view.ForEachSortedByAmount(
        [&](const WalletUtxo& utxo) -> bool
        {
            addToListing(utxo, utxo.IsImmatureCoinbase(virtualDaaScore, coinbaseMaturity_));
            return true;
        });
    for (const WalletUtxo& utxo: view.GetPendingAdditions())
    {
        addToListing(utxo, true);
    }

    listing.reserve(utxosByAddress.size());
    for (auto& addressAndUtxos: utxosByAddress)
    {
        AddressUtxos entry;
        entry.address = addressAndUtxos.first;
        entry.utxos.swap(addressAndUtxos.second);
        listing.push_back(entry);
    }
    return listing;
}
