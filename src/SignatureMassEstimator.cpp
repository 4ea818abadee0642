#include <SignatureMassEstimator.h>

namespace
{
// OP_DATA_65 <64 byte signature> <sighash type>
constexpr uint64_t SCHNORR_SIGNATURE_PUSH_SIZE = 66u;
// OP_DATA_66 <65 byte recoverable signature> <sighash type>
constexpr uint64_t ECDSA_SIGNATURE_PUSH_SIZE = 67u;
constexpr uint64_t SCHNORR_PUBLIC_KEY_SIZE = 32u;
constexpr uint64_t ECDSA_PUBLIC_KEY_SIZE = 33u;

uint64_t PushDataPrefixSize(uint64_t dataSize)
{
    if (dataSize <= 75u) return 1u;
    if (dataSize <= 0xffu) return 2u;
    if (dataSize <= 0xffffu) return 3u;
    return 5u;
}
} // anonymous namespace

uint64_t SchnorrSignatureMassEstimator::MaxSignatureScriptSize() const
{
    return SCHNORR_SIGNATURE_PUSH_SIZE;
}

uint8_t SchnorrSignatureMassEstimator::SigOpCountPerInput() const
{
    return 1u;
}

uint64_t EcdsaSignatureMassEstimator::MaxSignatureScriptSize() const
{
    return ECDSA_SIGNATURE_PUSH_SIZE;
}

uint8_t EcdsaSignatureMassEstimator::SigOpCountPerInput() const
{
    return 1u;
}

MultisigSignatureMassEstimator::MultisigSignatureMassEstimator(
    unsigned minimumSignatures,
    unsigned cosignerCount,
    bool ecdsa
    ): minimumSignatures_(minimumSignatures)
    , cosignerCount_(cosignerCount)
    , ecdsa_(ecdsa)
{
}

uint64_t MultisigSignatureMassEstimator::MaxSignatureScriptSize() const
{
    const uint64_t publicKeySize = ecdsa_ ? ECDSA_PUBLIC_KEY_SIZE : SCHNORR_PUBLIC_KEY_SIZE;
    const uint64_t signaturePushSize = ecdsa_ ? ECDSA_SIGNATURE_PUSH_SIZE : SCHNORR_SIGNATURE_PUSH_SIZE;
    // OP_m <push key>... OP_n OP_CHECKMULTISIG
    const uint64_t redeemScriptSize = 1u + cosignerCount_ * (1u + publicKeySize) + 1u + 1u;
    return minimumSignatures_ * signaturePushSize + PushDataPrefixSize(redeemScriptSize) + redeemScriptSize;
}

uint8_t MultisigSignatureMassEstimator::SigOpCountPerInput() const
{
    return static_cast<uint8_t>(cosignerCount_);
}

std::unique_ptr<I_SignatureMassEstimator> CreateSignatureMassEstimator(
    const std::string& signatureScheme,
    unsigned minimumSignatures,
    unsigned cosignerCount)
{
    const bool ecdsa = signatureScheme == "ecdsa";
    if (!ecdsa && signatureScheme != "schnorr")
        return std::unique_ptr<I_SignatureMassEstimator>();
    if (cosignerCount > 1u)
        return std::unique_ptr<I_SignatureMassEstimator>(new MultisigSignatureMassEstimator(minimumSignatures, cosignerCount, ecdsa));
    if (ecdsa)
        return std::unique_ptr<I_SignatureMassEstimator>(new EcdsaSignatureMassEstimator());
    return std::unique_ptr<I_SignatureMassEstimator>(new SchnorrSignatureMassEstimator());
}
