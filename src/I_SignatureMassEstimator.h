#ifndef I_SIGNATURE_MASS_ESTIMATOR_H
#define I_SIGNATURE_MASS_ESTIMATOR_H
#include <stdint.h>

/** Upper bound of what signing adds to an input, per signature scheme */
class I_SignatureMassEstimator
{
public:
    virtual ~I_SignatureMassEstimator(){}
    virtual uint64_t MaxSignatureScriptSize() const = 0;
    virtual uint8_t SigOpCountPerInput() const = 0;
};
#endif// I_SIGNATURE_MASS_ESTIMATOR_H
