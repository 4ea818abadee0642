#ifndef ADDRESS_DIRECTORY_H
#define ADDRESS_DIRECTORY_H
#include <I_AddressDirectory.h>
#include <sync.h>

class I_AddressEncoder;

/** The wallet's known addresses with versioned, lazily rebuilt lookup caches.
 *
 *  Every mutation bumps the version in the same critical section that
 *  changes the address set, so a cache stamped with version v always holds
 *  exactly the first v mutations.
 */
class AddressDirectory final: public I_AddressDirectory
{
private:
    const I_AddressEncoder& addressEncoder_;
    mutable CCriticalSection cs_directory;
    std::map<WalletAddress, std::string> addressByOwner_;
    std::map<Keychain, uint32_t> nextIndexByKeychain_;
    uint64_t version_;
    mutable std::shared_ptr<const VersionedAddressList> cachedAddressList_;
    mutable std::shared_ptr<const VersionedAddressOwnerMap> cachedOwnerMap_;

    bool RecordAddress(const WalletAddress& owner, const std::string& address);

public:
    explicit AddressDirectory(const I_AddressEncoder& addressEncoder);

    /** Returns false if the owner was already known */
    bool AddAddress(const WalletAddress& owner);
    WalletAddress DeriveNextAddress(Keychain keychain, std::string& address);
    uint64_t GetVersion() const;

    std::shared_ptr<const VersionedAddressList> GetMonitoredAddresses() const override;
    std::shared_ptr<const VersionedAddressOwnerMap> GetAddressOwnerMap() const override;
    bool GetAddressForOwner(const WalletAddress& owner, std::string& address) const override;
    bool GetChangeAddress(
        bool useExistingChangeAddress,
        const std::vector<std::string>& fromAddresses,
        std::string& changeAddress,
        WalletAddress& changeOwner) override;
};
#endif// ADDRESS_DIRECTORY_H
