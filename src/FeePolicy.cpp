#include <FeePolicy.h>

#include <I_NodeClient.h>
#include <Logging.h>
#include <defaultValues.h>

#include <limits>

FeePolicy FeePolicy::ExactFeeRate(double sompiPerGram)
{
    FeePolicy policy;
    policy.type = FeePolicyType::EXACT_FEE_RATE;
    policy.feeRate = sompiPerGram;
    return policy;
}

FeePolicy FeePolicy::MaxFeeRate(double sompiPerGram)
{
    FeePolicy policy;
    policy.type = FeePolicyType::MAX_FEE_RATE;
    policy.feeRate = sompiPerGram;
    return policy;
}

FeePolicy FeePolicy::MaxFee(CAmount maximumFee)
{
    FeePolicy policy;
    policy.type = FeePolicyType::MAX_FEE;
    policy.maxFee = maximumFee;
    return policy;
}

FeePolicyResolver::FeePolicyResolver(
    const I_NodeClient& nodeClient,
    CAmount defaultMaxFee
    ): nodeClient_(nodeClient)
    , defaultMaxFee_(defaultMaxFee)
{
}

WalletErrorKind FeePolicyResolver::ResolveFeeRate(
    const FeePolicy& feePolicy,
    CFeeRate& feeRate,
    std::string& errorMessage) const
{
    const CFeeRate minimumFeeRate(MINIMUM_RELAY_FEE_PER_KILOGRAM);
    if (feePolicy.type == FeePolicyType::EXACT_FEE_RATE || feePolicy.type == FeePolicyType::MAX_FEE_RATE)
    {
        if (CFeeRate::FromSompiPerGram(feePolicy.feeRate) < minimumFeeRate)
        {
            errorMessage = tfm::format("Requested fee rate %f is too low, minimum fee rate is %s", feePolicy.feeRate, minimumFeeRate.ToString());
            return WalletErrorKind::USER_INPUT_ERROR;
        }
    }
    if (feePolicy.type == FeePolicyType::MAX_FEE && feePolicy.maxFee == 0)
    {
        errorMessage = "Requested maximum fee must be positive";
        return WalletErrorKind::USER_INPUT_ERROR;
    }
    if (feePolicy.type == FeePolicyType::EXACT_FEE_RATE)
    {
        feeRate = CFeeRate::FromSompiPerGram(feePolicy.feeRate);
        feeRate.SetMaxFee(std::numeric_limits<CAmount>::max());
        return WalletErrorKind::NONE;
    }

    double estimatedRate = 0.0;
    std::string nodeError;
    if (!nodeClient_.GetFeeEstimate(estimatedRate, nodeError))
    {
        errorMessage = tfm::format("Unable to get fee estimate: %s", nodeError);
        error("%s: %s", __func__, errorMessage);
        return WalletErrorKind::TRANSIENT_FETCH_FAILURE;
    }
    CFeeRate estimatedFeeRate = CFeeRate::FromSompiPerGram(estimatedRate);
    if (estimatedFeeRate < minimumFeeRate)
        estimatedFeeRate = minimumFeeRate;

    switch (feePolicy.type)
    {
    case FeePolicyType::MAX_FEE_RATE:
    {
        const CFeeRate requestedFeeRate = CFeeRate::FromSompiPerGram(feePolicy.feeRate);
        feeRate = requestedFeeRate < estimatedFeeRate ? requestedFeeRate : estimatedFeeRate;
        feeRate.SetMaxFee(std::numeric_limits<CAmount>::max());
        break;
    }
    case FeePolicyType::MAX_FEE:
        feeRate = estimatedFeeRate;
        feeRate.SetMaxFee(feePolicy.maxFee);
        break;
    default:
        feeRate = estimatedFeeRate;
        feeRate.SetMaxFee(defaultMaxFee_);
        break;
    }
    LogPrint("selection", "%s: using %s, fee capped at %s\n", __func__, feeRate, FormatMoney(feeRate.GetMaxTxFee()));
    return WalletErrorKind::NONE;
}
