#include <WalletAddress.h>

#include <Logging.h>
#include <tinyformat.h>

WalletAddress::WalletAddress(
    ): index(0u)
    , cosignerIndex(0u)
    , keychain(Keychain::EXTERNAL)
{
}

WalletAddress::WalletAddress(
    uint32_t indexIn,
    uint16_t cosignerIndexIn,
    Keychain keychainIn
    ): index(indexIn)
    , cosignerIndex(cosignerIndexIn)
    , keychain(keychainIn)
{
}

bool operator==(const WalletAddress& a, const WalletAddress& b)
{
    return a.index == b.index && a.cosignerIndex == b.cosignerIndex && a.keychain == b.keychain;
}

bool operator!=(const WalletAddress& a, const WalletAddress& b)
{
    return !(a == b);
}

bool operator<(const WalletAddress& a, const WalletAddress& b)
{
    if (a.keychain != b.keychain) return a.keychain < b.keychain;
    if (a.cosignerIndex != b.cosignerIndex) return a.cosignerIndex < b.cosignerIndex;
    return a.index < b.index;
}

std::string WalletAddress::ToString() const
{
    return tfm::format("WalletAddress(keychain=%u, cosigner=%u, index=%u)",
        static_cast<unsigned>(keychain), cosignerIndex, index);
}

LOG_FORMAT_WITH_TOSTRING(WalletAddress)
