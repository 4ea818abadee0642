#include <DustCalculator.h>

#include <MassCalculator.h>
#include <defaultValues.h>
#include <primitives/transaction.h>

DustCalculator::DustCalculator(
    const MassCalculator& massCalculator
    ): massCalculator_(massCalculator)
    , minimumRelayFeeRate_(MINIMUM_RELAY_FEE_PER_KILOGRAM)
{
}

CAmount DustCalculator::MinimumValueForNonDust(const CTxOut& txout) const
{
    // An output is dust when spending it would cost more than a third of its
    // value at the minimum relay rate. Spending needs an input of about 148
    // bytes on top of the output's own serialized size.
    const uint64_t nSize = massCalculator_.CalculateOutputSerializedSize(txout) + 148u;
    return 3 * minimumRelayFeeRate_.GetFee(nSize);
}

bool DustCalculator::IsDust(const CTxOut& txout) const
{
    return txout.nValue < MinimumValueForNonDust(txout);
}
