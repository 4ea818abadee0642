#ifndef I_ADDRESS_DIRECTORY_H
#define I_ADDRESS_DIRECTORY_H
#include <WalletAddress.h>

#include <map>
#include <memory>
#include <stdint.h>
#include <string>
#include <unordered_map>
#include <vector>

struct VersionedAddressList
{
    uint64_t version;
    std::vector<std::string> addresses;
};

struct VersionedAddressOwnerMap
{
    uint64_t version;
    std::unordered_map<std::string, WalletAddress> ownerByAddress;
    std::map<WalletAddress, std::string> addressByOwner;
};

class I_AddressDirectory
{
public:
    virtual ~I_AddressDirectory(){}
    virtual std::shared_ptr<const VersionedAddressList> GetMonitoredAddresses() const = 0;
    virtual std::shared_ptr<const VersionedAddressOwnerMap> GetAddressOwnerMap() const = 0;
    virtual bool GetAddressForOwner(const WalletAddress& owner, std::string& address) const = 0;
    /** Change goes to the first restricted address when there is one, otherwise
     *  to internal index 0 (reuse) or to a freshly derived internal address. */
    virtual bool GetChangeAddress(
        bool useExistingChangeAddress,
        const std::vector<std::string>& fromAddresses,
        std::string& changeAddress,
        WalletAddress& changeOwner) = 0;
};
#endif// I_ADDRESS_DIRECTORY_H
