#ifndef FEE_RATE_H
#define FEE_RATE_H
#include <amount.h>

#include <stdint.h>
#include <string>

/** Type-safe wrapper class for fee rates
 * (how much to pay based on transaction mass)
 */
class CFeeRate
{
private:
    CAmount nSompiPerKiloGram; // unit is sompi-per-1,000-grams
    CAmount maxTransactionFee;
public:
    static const unsigned FEE_INCREMENT_STEPSIZE;
    CFeeRate();
    explicit CFeeRate(const CAmount& _nSompiPerKiloGram);
    CFeeRate(const CAmount& nFeePaid, uint64_t mass);
    /** Rate in sompi per gram, rounded up to the next sompi per kilogram */
    static CFeeRate FromSompiPerGram(double feeRate);

    /** ceil(mass * rate), capped at the maximum transaction fee */
    CAmount GetFee(uint64_t mass) const;
    CAmount GetFeePerKiloGram() const { return nSompiPerKiloGram; }
    const CAmount& GetMaxTxFee() const;
    void SetMaxFee(CAmount maximumTxFee);

    friend bool operator<(const CFeeRate& a, const CFeeRate& b) { return a.nSompiPerKiloGram < b.nSompiPerKiloGram; }
    friend bool operator>(const CFeeRate& a, const CFeeRate& b) { return a.nSompiPerKiloGram > b.nSompiPerKiloGram; }
    friend bool operator==(const CFeeRate& a, const CFeeRate& b) { return a.nSompiPerKiloGram == b.nSompiPerKiloGram; }
    friend bool operator<=(const CFeeRate& a, const CFeeRate& b) { return a.nSompiPerKiloGram <= b.nSompiPerKiloGram; }
    friend bool operator>=(const CFeeRate& a, const CFeeRate& b) { return a.nSompiPerKiloGram >= b.nSompiPerKiloGram; }
    std::string ToString() const;
};
#endif // FEE_RATE_H
