#ifndef UTXO_ENTRY_H
#define UTXO_ENTRY_H
#include <amount.h>
#include <ScriptPublicKey.h>

struct UtxoEntry
{
    CAmount amount;
    ScriptPublicKey scriptPublicKey;
    uint64_t blockDaaScore;
    bool isCoinbase;

    UtxoEntry(
        ): amount(0)
        , scriptPublicKey()
        , blockDaaScore(0)
        , isCoinbase(false)
    {
    }
    UtxoEntry(
        CAmount amountIn,
        const ScriptPublicKey& scriptPublicKeyIn,
        uint64_t blockDaaScoreIn,
        bool isCoinbaseIn
        ): amount(amountIn)
        , scriptPublicKey(scriptPublicKeyIn)
        , blockDaaScore(blockDaaScoreIn)
        , isCoinbase(isCoinbaseIn)
    {
    }
};
#endif// UTXO_ENTRY_H
