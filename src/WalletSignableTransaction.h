#ifndef WALLET_SIGNABLE_TRANSACTION_H
#define WALLET_SIGNABLE_TRANSACTION_H
#include <primitives/transaction.h>
#include <UtxoEntry.h>
#include <WalletAddress.h>
#include <WalletUtxo.h>

#include <map>
#include <set>
#include <vector>

/** A transaction built by this wallet, together with everything needed to
 *  sign it and to account for it before the network confirms it.
 */
class WalletSignableTransaction
{
private:
    CTransaction transaction_;
    std::vector<UtxoEntry> spentEntries_;
    std::vector<WalletAddress> addressByInputIndex_;
    std::map<unsigned, WalletAddress> addressByOutputIndex_;

public:
    WalletSignableTransaction(
        const CTransaction& transaction,
        const std::vector<UtxoEntry>& spentEntries,
        const std::vector<WalletAddress>& addressByInputIndex,
        const std::map<unsigned, WalletAddress>& addressByOutputIndex);

    const CTransaction& transaction() const { return transaction_; }
    const uint256& GetHash() const { return transaction_.GetHash(); }
    const std::vector<UtxoEntry>& spentEntries() const { return spentEntries_; }
    const std::vector<WalletAddress>& addressByInputIndex() const { return addressByInputIndex_; }
    const std::map<unsigned, WalletAddress>& addressByOutputIndex() const { return addressByOutputIndex_; }

    std::vector<COutPoint> GetConsumedOutPoints() const;
    /** Outputs paying back to the wallet, as they will look once accepted */
    std::vector<WalletUtxo> GetWalletOwnedOutputs() const;
    /** Keys the signer has to derive, one per distinct input owner */
    std::set<WalletAddress> GetSigningAddresses() const;

    CAmount GetValueIn() const;
    CAmount GetFee() const;
};
#endif// WALLET_SIGNABLE_TRANSACTION_H
