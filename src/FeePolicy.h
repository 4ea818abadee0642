#ifndef FEE_POLICY_H
#define FEE_POLICY_H
#include <amount.h>
#include <FeeRate.h>
#include <WalletError.h>

#include <string>

class I_NodeClient;

enum class FeePolicyType
{
    /** Node's estimated rate, fee capped at the configured default */
    DEFAULT,
    /** Pay exactly the given rate, uncapped */
    EXACT_FEE_RATE,
    /** Node's estimated rate, but never more than the given rate */
    MAX_FEE_RATE,
    /** Node's estimated rate, fee capped at the given amount */
    MAX_FEE,
};

struct FeePolicy
{
    FeePolicyType type;
    double feeRate;
    CAmount maxFee;

    FeePolicy(
        ): type(FeePolicyType::DEFAULT)
        , feeRate(0.0)
        , maxFee(0)
    {
    }

    static FeePolicy ExactFeeRate(double sompiPerGram);
    static FeePolicy MaxFeeRate(double sompiPerGram);
    static FeePolicy MaxFee(CAmount maximumFee);
};

/** Turns a caller's fee policy into a concrete rate and cap */
class FeePolicyResolver
{
private:
    const I_NodeClient& nodeClient_;
    const CAmount defaultMaxFee_;

public:
    FeePolicyResolver(
        const I_NodeClient& nodeClient,
        CAmount defaultMaxFee);

    /** Returns NONE on success, USER_INPUT_ERROR for a bad request and
     *  TRANSIENT_FETCH_FAILURE when the node cannot estimate a rate. */
    WalletErrorKind ResolveFeeRate(
        const FeePolicy& feePolicy,
        CFeeRate& feeRate,
        std::string& errorMessage) const;
};
#endif// FEE_POLICY_H
