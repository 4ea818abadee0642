#include <init.h>

#include <DataDirectory.h>
#include <Logging.h>
#include <Settings.h>

#include <boost/filesystem.hpp>

namespace
{

bool InitError(const std::string& str)
{
    LogPrintStr(tfm::format("Error: %s\n", str));
    return false;
}

} // anonymous namespace

bool InitializeSettings(int argc, const char* const argv[])
{
    Settings& settings = Settings::instance();
    settings.ParseParameters(argc, argv);
    ClearDatadirCache();

    if (!boost::filesystem::is_directory(GetDataDir()))
        return InitError(tfm::format("Specified data directory \"%s\" does not exist.", settings.GetArg("-datadir", "")));

    settings.ReadConfigFile();
    SetLoggingAndDebugSettings();

    LogPrintf("Using data directory %s\n", GetDataDir().string());
    LogPrintf("Using config file %s\n", settings.GetConfigFile().string());
    return true;
}
