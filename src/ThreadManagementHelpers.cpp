#include <ThreadManagementHelpers.h>

#include <stdio.h>
#include <typeinfo>

#if defined(__linux__)
#include <sys/prctl.h>
#endif

static std::string FormatException(const std::exception* pex, const char* pszThread)
{
    if (pex)
        return tfm::format(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), "kaswallet", pszThread);
    else
        return tfm::format(
            "UNKNOWN EXCEPTION       \n%s in %s       \n", "kaswallet", pszThread);
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    const std::string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

void RenameThread(const char* name)
{
#if defined(PR_SET_NAME)
    // Only the first 15 characters are used (16 - NUL terminator)
    ::prctl(PR_SET_NAME, name, 0, 0, 0);
#else
    // Prevent warnings for unused parameters...
    (void)name;
#endif
}
