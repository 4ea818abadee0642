#ifndef I_ADDRESS_ENCODER_H
#define I_ADDRESS_ENCODER_H
#include <ScriptPublicKey.h>
#include <WalletAddress.h>

#include <string>

/** Key derivation and address encoding, provided by the keys layer */
class I_AddressEncoder
{
public:
    virtual ~I_AddressEncoder(){}
    virtual std::string EncodeAddress(const WalletAddress& owner) const = 0;
    virtual bool GetScriptForAddress(const std::string& address, ScriptPublicKey& scriptPublicKey) const = 0;
};
#endif// I_ADDRESS_ENCODER_H
