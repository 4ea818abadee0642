#include <WalletUtxo.h>

#include <Logging.h>
#include <tinyformat.h>

WalletUtxo::WalletUtxo(
    const COutPoint& outpoint,
    const UtxoEntry& utxoEntry,
    const WalletAddress& address
    ): outpoint_(outpoint)
    , utxoEntry_(utxoEntry)
    , address_(address)
{
}

bool WalletUtxo::IsImmatureCoinbase(uint64_t virtualDaaScore, uint64_t coinbaseMaturity) const
{
    if (!utxoEntry_.isCoinbase)
        return false;
    return utxoEntry_.blockDaaScore + coinbaseMaturity > virtualDaaScore;
}

std::string WalletUtxo::ToString() const
{
    return tfm::format("WalletUtxo(%s, amount=%d, daaScore=%u%s, %s)",
        outpoint_.ToString(),
        utxoEntry_.amount,
        utxoEntry_.blockDaaScore,
        utxoEntry_.isCoinbase ? ", coinbase" : "",
        address_.ToString());
}

LOG_FORMAT_WITH_TOSTRING(WalletUtxo)
