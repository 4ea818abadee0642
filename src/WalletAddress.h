#ifndef WALLET_ADDRESS_H
#define WALLET_ADDRESS_H
#include <stddef.h>
#include <stdint.h>
#include <string>

enum class Keychain : uint8_t
{
    EXTERNAL = 0,
    INTERNAL = 1,
};

/** Owner record of a wallet address: where in the key tree it was derived */
class WalletAddress
{
public:
    uint32_t index;
    uint16_t cosignerIndex;
    Keychain keychain;

    WalletAddress();
    WalletAddress(uint32_t indexIn, uint16_t cosignerIndexIn, Keychain keychainIn);

    friend bool operator==(const WalletAddress& a, const WalletAddress& b);
    friend bool operator!=(const WalletAddress& a, const WalletAddress& b);
    friend bool operator<(const WalletAddress& a, const WalletAddress& b);
    std::string ToString() const;
};

struct WalletAddressHasher
{
    size_t operator()(const WalletAddress& address) const
    {
        return (static_cast<size_t>(address.index) << 17) ^
            (static_cast<size_t>(address.cosignerIndex) << 1) ^
            static_cast<size_t>(address.keychain);
    }
};
#endif// WALLET_ADDRESS_H
