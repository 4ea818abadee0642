#ifndef DUST_CALCULATOR_H
#define DUST_CALCULATOR_H
#include <amount.h>
#include <FeeRate.h>

class CTxOut;
class MassCalculator;

class DustCalculator
{
private:
    const MassCalculator& massCalculator_;
    const CFeeRate minimumRelayFeeRate_;

public:
    explicit DustCalculator(const MassCalculator& massCalculator);

    CAmount MinimumValueForNonDust(const CTxOut& txout) const;
    bool IsDust(const CTxOut& txout) const;
};
#endif// DUST_CALCULATOR_H
