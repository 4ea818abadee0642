#include <AddressDirectory.h>

#include <I_AddressEncoder.h>
#include <Logging.h>

AddressDirectory::AddressDirectory(
    const I_AddressEncoder& addressEncoder
    ): addressEncoder_(addressEncoder)
    , cs_directory()
    , addressByOwner_()
    , nextIndexByKeychain_()
    , version_(0u)
    , cachedAddressList_()
    , cachedOwnerMap_()
{
}

bool AddressDirectory::RecordAddress(const WalletAddress& owner, const std::string& address)
{
    LOCK(cs_directory);
    if (!addressByOwner_.insert(std::make_pair(owner, address)).second)
        return false;
    uint32_t& nextIndex = nextIndexByKeychain_[owner.keychain];
    if (owner.index >= nextIndex)
        nextIndex = owner.index + 1;
    ++version_;
    LogPrint("directory", "%s: %s is %s, version %u\n", __func__, address, owner, version_);
    return true;
}

bool AddressDirectory::AddAddress(const WalletAddress& owner)
{
    {
        LOCK(cs_directory);
        if (addressByOwner_.count(owner) > 0)
            return false;
    }
    // Derivation may be slow, nothing is held while it runs
    const std::string address = addressEncoder_.EncodeAddress(owner);
    return RecordAddress(owner, address);
}

WalletAddress AddressDirectory::DeriveNextAddress(Keychain keychain, std::string& address)
{
    WalletAddress owner(0u, 0u, keychain);
    {
        LOCK(cs_directory);
        owner.index = nextIndexByKeychain_[keychain]++;
    }
    address = addressEncoder_.EncodeAddress(owner);
    RecordAddress(owner, address);
    return owner;
}

uint64_t AddressDirectory::GetVersion() const
{
    LOCK(cs_directory);
    return version_;
}

std::shared_ptr<const VersionedAddressList> AddressDirectory::GetMonitoredAddresses() const
{
    LOCK(cs_directory);
    if (!cachedAddressList_ || cachedAddressList_->version != version_)
    {
        std::shared_ptr<VersionedAddressList> addressList = std::make_shared<VersionedAddressList>();
        addressList->version = version_;
        addressList->addresses.reserve(addressByOwner_.size());
        for (const auto& ownerAndAddress: addressByOwner_)
        {
            addressList->addresses.push_back(ownerAndAddress.second);
        }
        cachedAddressList_ = addressList;
    }
    return cachedAddressList_;
}

std::shared_ptr<const VersionedAddressOwnerMap> AddressDirectory::GetAddressOwnerMap() const
{
    LOCK(cs_directory);
    if (!cachedOwnerMap_ || cachedOwnerMap_->version != version_)
    {
        std::shared_ptr<VersionedAddressOwnerMap> ownerMap = std::make_shared<VersionedAddressOwnerMap>();
        ownerMap->version = version_;
        ownerMap->addressByOwner = addressByOwner_;
        ownerMap->ownerByAddress.reserve(addressByOwner_.size());
        for (const auto& ownerAndAddress: addressByOwner_)
        {
            ownerMap->ownerByAddress.insert(std::make_pair(ownerAndAddress.second, ownerAndAddress.first));
        }
        cachedOwnerMap_ = ownerMap;
    }
    return cachedOwnerMap_;
}

bool AddressDirectory::GetAddressForOwner(const WalletAddress& owner, std::string& address) const
{
    LOCK(cs_directory);
    const auto it = addressByOwner_.find(owner);
    if (it == addressByOwner_.end())
        return false;
    address = it->second;
    return true;
}

bool AddressDirectory::GetChangeAddress(
    bool useExistingChangeAddress,
    const std::vector<std::string>& fromAddresses,
    std::string& changeAddress,
    WalletAddress& changeOwner)
{
    if (!fromAddresses.empty())
    {
        const std::shared_ptr<const VersionedAddressOwnerMap> ownerMap = GetAddressOwnerMap();
        const auto it = ownerMap->ownerByAddress.find(fromAddresses.front());
        if (it == ownerMap->ownerByAddress.end())
            return error("%s: %s is not a wallet address", __func__, fromAddresses.front());
        changeAddress = it->first;
        changeOwner = it->second;
        return true;
    }
    if (useExistingChangeAddress)
    {
        changeOwner = WalletAddress(0u, 0u, Keychain::INTERNAL);
        {
            LOCK(cs_directory);
            const auto it = addressByOwner_.find(changeOwner);
            if (it != addressByOwner_.end())
            {
                changeAddress = it->second;
                return true;
            }
        }
        changeAddress = addressEncoder_.EncodeAddress(changeOwner);
        RecordAddress(changeOwner, changeAddress);
        return true;
    }
    changeOwner = DeriveNextAddress(Keychain::INTERNAL, changeAddress);
    return true;
}
