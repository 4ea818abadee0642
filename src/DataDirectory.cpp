#include <DataDirectory.h>

#include <Settings.h>
#include <sync.h>

#include <boost/filesystem.hpp>

#include <cstdlib>
#include <cstring>

namespace
{
boost::filesystem::path pathCached;
CCriticalSection csPathCached;
} // anonymous namespace

/**
 * Ignores exceptions thrown by Boost's create_directory if the requested directory exists.
 * Specifically handles case where path p exists, but it wasn't possible for the user to
 * write to the parent directory.
 */
bool TryCreateDirectory(const boost::filesystem::path& p)
{
    try {
        return boost::filesystem::create_directory(p);
    } catch (const boost::filesystem::filesystem_error&) {
        if (!boost::filesystem::exists(p) || !boost::filesystem::is_directory(p))
            throw;
    }

    // create_directory didn't create the directory, it had to have existed already
    return false;
}

boost::filesystem::path GetDefaultDataDir()
{
    namespace fs = boost::filesystem;
    // Unix: ~/.kaswallet
    fs::path pathRet;
    const char* pszHome = getenv("HOME");
    if (pszHome == NULL || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".kaswallet";
}

const boost::filesystem::path& GetDataDir()
{
    namespace fs = boost::filesystem;

    LOCK(csPathCached);

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!pathCached.empty())
        return pathCached;

    const Settings& settings = Settings::instance();
    if (settings.ParameterIsSet("-datadir")) {
        pathCached = fs::system_complete(settings.GetParameter("-datadir"));
        if (!fs::is_directory(pathCached)) {
            pathCached = "";
            return pathCached;
        }
    } else {
        pathCached = GetDefaultDataDir();
    }

    fs::create_directories(pathCached);

    return pathCached;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = boost::filesystem::path();
}
