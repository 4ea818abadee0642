#ifndef WALLET_ERROR_H
#define WALLET_ERROR_H
#include <string>

enum class WalletErrorKind
{
    NONE,
    /** Selection cannot cover target plus fee */
    INSUFFICIENT_FUNDS,
    /** A consensus UTXO pays to an address the directory does not know */
    UNRESOLVABLE_OWNER,
    /** The node could not be reached or returned an error */
    TRANSIENT_FETCH_FAILURE,
    /** Snapshot length/order invariant broken, never expected at runtime */
    INVARIANT_VIOLATION,
    /** The address restriction excludes every eligible UTXO */
    RESTRICTION_UNSATISFIABLE,
    USER_INPUT_ERROR,
    /** A produced transaction failed its own fee or shape check */
    SANITY_CHECK_FAILED,
    /** Served before the first sync cycle completed */
    NOT_SYNCED,
    /** The node refused a signed transaction */
    SUBMISSION_REJECTED,
};

const char* WalletErrorKindToString(WalletErrorKind kind);

#endif// WALLET_ERROR_H
