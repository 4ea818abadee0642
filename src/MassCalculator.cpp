#include <MassCalculator.h>

#include <I_SignatureMassEstimator.h>
#include <defaultValues.h>

namespace
{
constexpr uint64_t OUTPOINT_SIZE = 32u + 4u;
constexpr uint64_t LENGTH_PREFIX_SIZE = 8u;
constexpr uint64_t SEQUENCE_SIZE = 8u;
constexpr uint64_t VALUE_SIZE = 8u;
constexpr uint64_t SCRIPT_VERSION_SIZE = 2u;
// version, input count, output count, lock time, subnetwork id, gas, payload hash, payload length
constexpr uint64_t TRANSACTION_HEADER_SIZE = 2u + 8u + 8u + 8u + 20u + 8u + 32u + 8u;
} // anonymous namespace

MassCalculator::MassCalculator(
    const I_SignatureMassEstimator& signatureMassEstimator
    ): signatureMassEstimator_(signatureMassEstimator)
{
}

uint64_t MassCalculator::CalculateInputMass(const CTxIn& input) const
{
    const uint64_t signatureScriptSize = input.signatureScript.empty()
        ? signatureMassEstimator_.MaxSignatureScriptSize()
        : input.signatureScript.size();
    const uint64_t serializedSize = OUTPOINT_SIZE + LENGTH_PREFIX_SIZE + signatureScriptSize + SEQUENCE_SIZE;
    return serializedSize * MASS_PER_TX_BYTE + input.sigOpCount * MASS_PER_SIG_OP;
}

uint64_t MassCalculator::CalculateOutputSerializedSize(const CTxOut& output) const
{
    return VALUE_SIZE + SCRIPT_VERSION_SIZE + LENGTH_PREFIX_SIZE + output.scriptPubKey.script.size();
}

uint64_t MassCalculator::CalculateOutputMass(const CTxOut& output) const
{
    const uint64_t scriptSize = output.scriptPubKey.script.size();
    return CalculateOutputSerializedSize(output) * MASS_PER_TX_BYTE + (SCRIPT_VERSION_SIZE + scriptSize) * MASS_PER_SCRIPT_PUB_KEY_BYTE;
}

uint64_t MassCalculator::CalculateFixedMass(size_t payloadSize) const
{
    return (TRANSACTION_HEADER_SIZE + payloadSize) * MASS_PER_TX_BYTE;
}

uint64_t MassCalculator::CalculateMassPerInput() const
{
    CTxIn unsignedInput(COutPoint(), SigOpCountPerInput());
    return CalculateInputMass(unsignedInput);
}

uint64_t MassCalculator::CalculateMassWithoutInputs(const std::vector<CTxOut>& outputs, size_t payloadSize) const
{
    uint64_t mass = CalculateFixedMass(payloadSize);
    for (const CTxOut& output: outputs)
    {
        mass += CalculateOutputMass(output);
    }
    return mass;
}

uint64_t MassCalculator::CalculateTransactionMass(const CMutableTransaction& transaction) const
{
    uint64_t mass = CalculateMassWithoutInputs(transaction.vout, transaction.payload.size());
    for (const CTxIn& input: transaction.vin)
    {
        mass += CalculateInputMass(input);
    }
    return mass;
}

uint64_t MassCalculator::CalculateTransactionMass(const CTransaction& transaction) const
{
    return CalculateTransactionMass(CMutableTransaction(transaction));
}

uint8_t MassCalculator::SigOpCountPerInput() const
{
    return signatureMassEstimator_.SigOpCountPerInput();
}
