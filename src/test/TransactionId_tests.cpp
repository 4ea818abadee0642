#include <test/test_only.h>
#include <primitives/transaction.h>
#include <test/WalletUtxoGenerator.h>

namespace
{
CMutableTransaction CreateTransaction(const WalletUtxoGenerator& utxoGenerator)
{
    CMutableTransaction tx;
    tx.vin.emplace_back(COutPoint(utxoGenerator.RandomHash(), 1u), 1u);
    tx.vin.emplace_back(COutPoint(utxoGenerator.RandomHash(), 0u), 1u);
    tx.vout.emplace_back(5000, ScriptPublicKey(0u, std::vector<unsigned char>(34u, 0x20)));
    return tx;
}
}

BOOST_AUTO_TEST_SUITE(TransactionIdTests)

BOOST_AUTO_TEST_CASE(theIdIsStableAcrossSigning)
{
    WalletUtxoGenerator utxoGenerator;
    CMutableTransaction tx = CreateTransaction(utxoGenerator);
    const uint256 unsignedId = CTransaction(tx).GetHash();
    tx.vin[0].signatureScript.assign(66u, 0x41);
    BOOST_CHECK(CTransaction(tx).GetHash() == unsignedId);
    BOOST_CHECK(tx.GetHash() == unsignedId);
    BOOST_CHECK(!unsignedId.IsNull());
}

BOOST_AUTO_TEST_CASE(theIdCommitsToOutputsAndPayload)
{
    WalletUtxoGenerator utxoGenerator;
    CMutableTransaction tx = CreateTransaction(utxoGenerator);
    const uint256 originalId = tx.GetHash();

    CMutableTransaction differentValue = tx;
    differentValue.vout[0].nValue += 1;
    BOOST_CHECK(differentValue.GetHash() != originalId);

    CMutableTransaction withPayload = tx;
    withPayload.payload.push_back(0x01);
    BOOST_CHECK(withPayload.GetHash() != originalId);

    CMutableTransaction reordered = tx;
    std::swap(reordered.vin[0], reordered.vin[1]);
    BOOST_CHECK(reordered.GetHash() != originalId);
}

BOOST_AUTO_TEST_CASE(aRoundTripThroughTheImmutableFormKeepsTheId)
{
    WalletUtxoGenerator utxoGenerator;
    const CTransaction tx(CreateTransaction(utxoGenerator));
    BOOST_CHECK(CMutableTransaction(tx).GetHash() == tx.GetHash());
    BOOST_CHECK_EQUAL(tx.GetValueOut(), 5000);
}

BOOST_AUTO_TEST_SUITE_END()
