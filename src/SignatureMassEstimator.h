#ifndef SIGNATURE_MASS_ESTIMATOR_H
#define SIGNATURE_MASS_ESTIMATOR_H
#include <I_SignatureMassEstimator.h>

#include <memory>
#include <string>

/** Single key, 64 byte Schnorr signature */
class SchnorrSignatureMassEstimator final: public I_SignatureMassEstimator
{
public:
    uint64_t MaxSignatureScriptSize() const override;
    uint8_t SigOpCountPerInput() const override;
};

/** Single key, 64 byte compact ECDSA signature */
class EcdsaSignatureMassEstimator final: public I_SignatureMassEstimator
{
public:
    uint64_t MaxSignatureScriptSize() const override;
    uint8_t SigOpCountPerInput() const override;
};

/** m-of-n pay-to-script-hash multisig */
class MultisigSignatureMassEstimator final: public I_SignatureMassEstimator
{
private:
    const unsigned minimumSignatures_;
    const unsigned cosignerCount_;
    const bool ecdsa_;

public:
    MultisigSignatureMassEstimator(
        unsigned minimumSignatures,
        unsigned cosignerCount,
        bool ecdsa);
    uint64_t MaxSignatureScriptSize() const override;
    uint8_t SigOpCountPerInput() const override;
};

/** Picks the estimator for a wallet's key layout. Null for an unknown scheme. */
std::unique_ptr<I_SignatureMassEstimator> CreateSignatureMassEstimator(
    const std::string& signatureScheme,
    unsigned minimumSignatures,
    unsigned cosignerCount);
#endif// SIGNATURE_MASS_ESTIMATOR_H
