#include <WalletError.h>

const char* WalletErrorKindToString(WalletErrorKind kind)
{
    switch (kind)
    {
    case WalletErrorKind::NONE:
        return "none";
    case WalletErrorKind::INSUFFICIENT_FUNDS:
        return "insufficient funds";
    case WalletErrorKind::UNRESOLVABLE_OWNER:
        return "unresolvable owner";
    case WalletErrorKind::TRANSIENT_FETCH_FAILURE:
        return "transient fetch failure";
    case WalletErrorKind::INVARIANT_VIOLATION:
        return "invariant violation";
    case WalletErrorKind::RESTRICTION_UNSATISFIABLE:
        return "restriction unsatisfiable";
    case WalletErrorKind::USER_INPUT_ERROR:
        return "user input error";
    case WalletErrorKind::SANITY_CHECK_FAILED:
        return "sanity check failed";
    case WalletErrorKind::NOT_SYNCED:
        return "not synced";
    case WalletErrorKind::SUBMISSION_REJECTED:
        return "submission rejected";
    }
    return "unknown";
}
