#include <test/test_only.h>
#include <FeePolicy.h>
#include <defaultValues.h>
#include <test/MockNodeClient.h>

#include <limits>

using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class FeePolicyTestFixture
{
public:
    NiceMock<MockNodeClient> nodeClient;
    FeePolicyResolver resolver;
    CFeeRate feeRate;
    std::string errorMessage;

    FeePolicyTestFixture(
        ): nodeClient()
        , resolver(nodeClient, DEFAULT_TRANSACTION_MAXFEE)
        , feeRate()
        , errorMessage()
    {
    }

    void setEstimate(double estimate)
    {
        ON_CALL(nodeClient, GetFeeEstimate(_, _)).WillByDefault(DoAll(SetArgReferee<0>(estimate), Return(true)));
    }
};

BOOST_FIXTURE_TEST_SUITE(FeePolicyTests, FeePolicyTestFixture)

BOOST_AUTO_TEST_CASE(feeIsRoundedUpToTheNextSompi)
{
    const CFeeRate rate(1500);
    BOOST_CHECK_EQUAL(rate.GetFee(1u), 2);
    BOOST_CHECK_EQUAL(rate.GetFee(1000u), 1500);
    BOOST_CHECK_EQUAL(rate.GetFee(0u), 0);
}

BOOST_AUTO_TEST_CASE(feeIsCappedAtTheMaximum)
{
    CFeeRate rate(1000);
    rate.SetMaxFee(500);
    BOOST_CHECK_EQUAL(rate.GetFee(100000u), 500);
}

BOOST_AUTO_TEST_CASE(aRateCanBeDerivedFromAPaidFee)
{
    BOOST_CHECK(CFeeRate(2236, 1118u) == CFeeRate(2000));
    BOOST_CHECK(CFeeRate(100, 0u) == CFeeRate(0));
    BOOST_CHECK(CFeeRate::FromSompiPerGram(1.0001) == CFeeRate(1001));
    BOOST_CHECK(CFeeRate::FromSompiPerGram(-1.0) == CFeeRate(0));
}

BOOST_AUTO_TEST_CASE(anExactRateIsUsedAsIsWithoutAskingTheNode)
{
    EXPECT_CALL(nodeClient, GetFeeEstimate(_, _)).Times(0);
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::ExactFeeRate(2.0), feeRate, errorMessage) == WalletErrorKind::NONE);
    BOOST_CHECK(feeRate == CFeeRate(2000));
    BOOST_CHECK_EQUAL(feeRate.GetMaxTxFee(), std::numeric_limits<CAmount>::max());
}

BOOST_AUTO_TEST_CASE(ratesBelowTheRelayMinimumAreRefused)
{
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::ExactFeeRate(0.5), feeRate, errorMessage) == WalletErrorKind::USER_INPUT_ERROR);
    BOOST_CHECK(!errorMessage.empty());
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::MaxFeeRate(0.1), feeRate, errorMessage) == WalletErrorKind::USER_INPUT_ERROR);
}

BOOST_AUTO_TEST_CASE(theDefaultPolicyUsesTheEstimateCappedAtTheDefaultMaximum)
{
    setEstimate(3.0);
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy(), feeRate, errorMessage) == WalletErrorKind::NONE);
    BOOST_CHECK(feeRate == CFeeRate(3000));
    BOOST_CHECK_EQUAL(feeRate.GetMaxTxFee(), DEFAULT_TRANSACTION_MAXFEE);
}

BOOST_AUTO_TEST_CASE(anEstimateBelowTheRelayMinimumIsRaisedToIt)
{
    setEstimate(0.2);
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy(), feeRate, errorMessage) == WalletErrorKind::NONE);
    BOOST_CHECK(feeRate == CFeeRate(MINIMUM_RELAY_FEE_PER_KILOGRAM));
}

BOOST_AUTO_TEST_CASE(aMaximumRateLimitsTheEstimate)
{
    setEstimate(3.0);
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::MaxFeeRate(1.5), feeRate, errorMessage) == WalletErrorKind::NONE);
    BOOST_CHECK(feeRate == CFeeRate(1500));
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::MaxFeeRate(5.0), feeRate, errorMessage) == WalletErrorKind::NONE);
    BOOST_CHECK(feeRate == CFeeRate(3000));
}

BOOST_AUTO_TEST_CASE(aMaximumFeeCapsTheEstimatedFee)
{
    setEstimate(1.0);
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::MaxFee(500), feeRate, errorMessage) == WalletErrorKind::NONE);
    BOOST_CHECK_EQUAL(feeRate.GetMaxTxFee(), 500);
    BOOST_CHECK_EQUAL(feeRate.GetFee(1000000u), 500);
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy::MaxFee(0), feeRate, errorMessage) == WalletErrorKind::USER_INPUT_ERROR);
}

BOOST_AUTO_TEST_CASE(aFailedEstimateIsTransient)
{
    ON_CALL(nodeClient, GetFeeEstimate(_, _)).WillByDefault(DoAll(SetArgReferee<1>(std::string("timeout")), Return(false)));
    BOOST_CHECK(resolver.ResolveFeeRate(FeePolicy(), feeRate, errorMessage) == WalletErrorKind::TRANSIENT_FETCH_FAILURE);
    BOOST_CHECK(errorMessage.find("timeout") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
