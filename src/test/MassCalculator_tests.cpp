#include <test/test_only.h>
#include <MassCalculator.h>
#include <DustCalculator.h>
#include <SignatureMassEstimator.h>
#include <defaultValues.h>
#include <test/MockSignatureMassEstimator.h>

using ::testing::NiceMock;
using ::testing::Return;

namespace
{
CTxOut PayToPublicKeyOutput(CAmount value)
{
    std::vector<unsigned char> script(34u, 0x01);
    script[0] = 0x20;
    script[33] = 0xac;
    return CTxOut(value, ScriptPublicKey(0u, script));
}
}

class MassCalculatorTestFixture
{
public:
    SchnorrSignatureMassEstimator schnorrEstimator;
    MassCalculator massCalculator;

    MassCalculatorTestFixture(
        ): schnorrEstimator()
        , massCalculator(schnorrEstimator)
    {
    }
};

BOOST_FIXTURE_TEST_SUITE(MassCalculatorTests, MassCalculatorTestFixture)

BOOST_AUTO_TEST_CASE(anEmptyTransactionOnlyWeighsItsHeader)
{
    BOOST_CHECK_EQUAL(massCalculator.CalculateTransactionMass(CMutableTransaction()), 94u);
}

BOOST_AUTO_TEST_CASE(aPayToPublicKeyOutputWeighsItsBytesAndScript)
{
    const CTxOut output = PayToPublicKeyOutput(100);
    BOOST_CHECK_EQUAL(massCalculator.CalculateOutputSerializedSize(output), 52u);
    BOOST_CHECK_EQUAL(massCalculator.CalculateOutputMass(output), 412u);
}

BOOST_AUTO_TEST_CASE(anUnsignedSchnorrInputIsChargedTheFullSignature)
{
    BOOST_CHECK_EQUAL(massCalculator.CalculateMassPerInput(), 1118u);

    CMutableTransaction tx;
    tx.vin.emplace_back(COutPoint(), 1u);
    tx.vout.push_back(PayToPublicKeyOutput(100));
    BOOST_CHECK_EQUAL(massCalculator.CalculateTransactionMass(tx), 94u + 1118u + 412u);
}

BOOST_AUTO_TEST_CASE(aSignedInputIsChargedItsActualScript)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(COutPoint(), 1u);
    tx.vin[0].signatureScript.assign(10u, 0x00);
    BOOST_CHECK_EQUAL(massCalculator.CalculateTransactionMass(tx), 94u + (36u + 8u + 10u + 8u) + 1000u);
}

BOOST_AUTO_TEST_CASE(massIsTheSameForTheImmutableTransaction)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(COutPoint(), 1u);
    tx.vin.emplace_back(COutPoint(), 1u);
    tx.vout.push_back(PayToPublicKeyOutput(100));
    tx.payload.assign(16u, 0x05);
    BOOST_CHECK_EQUAL(massCalculator.CalculateTransactionMass(CTransaction(tx)), massCalculator.CalculateTransactionMass(tx));
    BOOST_CHECK_EQUAL(massCalculator.CalculateTransactionMass(tx), 94u + 16u + 2u * 1118u + 412u);
}

BOOST_AUTO_TEST_CASE(massWithoutInputsCountsOutputsAndPayload)
{
    std::vector<CTxOut> outputs;
    outputs.push_back(PayToPublicKeyOutput(1));
    outputs.push_back(PayToPublicKeyOutput(2));
    BOOST_CHECK_EQUAL(massCalculator.CalculateMassWithoutInputs(outputs, 3u), 94u + 3u + 2u * 412u);
}

BOOST_AUTO_TEST_CASE(willUseTheEstimatorsSignatureBound)
{
    NiceMock<MockSignatureMassEstimator> estimator;
    ON_CALL(estimator, MaxSignatureScriptSize()).WillByDefault(Return(100u));
    ON_CALL(estimator, SigOpCountPerInput()).WillByDefault(Return(2u));
    MassCalculator calculator(estimator);
    BOOST_CHECK_EQUAL(calculator.CalculateMassPerInput(), (36u + 8u + 100u + 8u) + 2000u);
    BOOST_CHECK_EQUAL(calculator.SigOpCountPerInput(), 2u);
}

BOOST_AUTO_TEST_CASE(ecdsaSignaturesAreOneByteLonger)
{
    EcdsaSignatureMassEstimator estimator;
    MassCalculator calculator(estimator);
    BOOST_CHECK_EQUAL(calculator.CalculateMassPerInput(), 1119u);
}

BOOST_AUTO_TEST_CASE(multisigInputsCarryEverySignatureAndTheRedeemScript)
{
    MultisigSignatureMassEstimator estimator(2u, 3u, false);
    BOOST_CHECK_EQUAL(estimator.MaxSignatureScriptSize(), 236u);
    BOOST_CHECK_EQUAL(estimator.SigOpCountPerInput(), 3u);
    MassCalculator calculator(estimator);
    BOOST_CHECK_EQUAL(calculator.CalculateMassPerInput(), 3288u);
}

BOOST_AUTO_TEST_CASE(willPickTheEstimatorForTheKeyLayout)
{
    BOOST_CHECK(CreateSignatureMassEstimator("schnorr", 1u, 1u)->MaxSignatureScriptSize() == 66u);
    BOOST_CHECK(CreateSignatureMassEstimator("ecdsa", 1u, 1u)->MaxSignatureScriptSize() == 67u);
    BOOST_CHECK(CreateSignatureMassEstimator("schnorr", 2u, 3u)->SigOpCountPerInput() == 3u);
    BOOST_CHECK(!CreateSignatureMassEstimator("rsa", 1u, 1u));
}

BOOST_AUTO_TEST_CASE(dustIsThreeTimesTheCostOfSpendingAtTheRelayRate)
{
    DustCalculator dustCalculator(massCalculator);
    BOOST_CHECK_EQUAL(dustCalculator.MinimumValueForNonDust(PayToPublicKeyOutput(0)), 600);
    BOOST_CHECK(dustCalculator.IsDust(PayToPublicKeyOutput(599)));
    BOOST_CHECK(!dustCalculator.IsDust(PayToPublicKeyOutput(600)));
}

BOOST_AUTO_TEST_SUITE_END()
