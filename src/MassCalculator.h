#ifndef MASS_CALCULATOR_H
#define MASS_CALCULATOR_H
#include <primitives/transaction.h>

#include <stddef.h>
#include <stdint.h>
#include <vector>

class I_SignatureMassEstimator;

/** Estimates the mass a transaction will have once signed.
 *
 *  Mass = serialized size + weighted locking script bytes + weighted sigops.
 *  Inputs without a signature script yet are charged the estimator's upper
 *  bound for their signature, so the estimate never undershoots.
 */
class MassCalculator
{
private:
    const I_SignatureMassEstimator& signatureMassEstimator_;

    uint64_t CalculateInputMass(const CTxIn& input) const;
    uint64_t CalculateFixedMass(size_t payloadSize) const;

public:
    explicit MassCalculator(const I_SignatureMassEstimator& signatureMassEstimator);

    uint64_t CalculateTransactionMass(const CMutableTransaction& transaction) const;
    uint64_t CalculateTransactionMass(const CTransaction& transaction) const;
    /** Mass added by one more unsigned wallet input */
    uint64_t CalculateMassPerInput() const;
    uint64_t CalculateOutputMass(const CTxOut& output) const;
    uint64_t CalculateOutputSerializedSize(const CTxOut& output) const;
    uint64_t CalculateMassWithoutInputs(const std::vector<CTxOut>& outputs, size_t payloadSize) const;
    uint8_t SigOpCountPerInput() const;
};
#endif// MASS_CALCULATOR_H
