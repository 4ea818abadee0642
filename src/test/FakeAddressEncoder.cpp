#include <test/FakeAddressEncoder.h>

#include <tinyformat.h>

const std::string FakeAddressEncoder::prefix = "kaspatest:";

std::string FakeAddressEncoder::EncodeAddress(const WalletAddress& owner) const
{
    return tfm::format("%s%u-%u-%u", prefix, static_cast<unsigned>(owner.keychain), owner.cosignerIndex, owner.index);
}

bool FakeAddressEncoder::GetScriptForAddress(const std::string& address, ScriptPublicKey& scriptPublicKey) const
{
    if (address.compare(0, prefix.size(), prefix) != 0 || address.size() == prefix.size())
        return false;
    // OP_DATA_32 <32 bytes> OP_CHECKSIG
    std::vector<unsigned char> script(34u, 0u);
    script[0] = 0x20;
    const std::string body = address.substr(prefix.size());
    for (size_t position = 0; position < body.size(); ++position)
    {
        script[1 + position % 32] ^= static_cast<unsigned char>(body[position] + position);
    }
    script[33] = 0xac;
    scriptPublicKey = ScriptPublicKey(0u, script);
    return true;
}
