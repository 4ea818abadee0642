#ifndef FAKE_ADDRESS_ENCODER_H
#define FAKE_ADDRESS_ENCODER_H
#include <I_AddressEncoder.h>

/** Deterministic stand-in for the key layer. Addresses spell out the
 *  derivation path; scripts are 34 byte pay-to-pubkey shaped blobs. */
class FakeAddressEncoder final: public I_AddressEncoder
{
public:
    static const std::string prefix;

    std::string EncodeAddress(const WalletAddress& owner) const override;
    bool GetScriptForAddress(const std::string& address, ScriptPublicKey& scriptPublicKey) const override;
};
#endif// FAKE_ADDRESS_ENCODER_H
