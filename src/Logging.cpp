#include <Logging.h>

#include <DataDirectory.h>
#include <OutPoint.h>
#include <Settings.h>
#include <uint256.h>
#include <utiltime.h>

#include <boost/filesystem/path.hpp>
#include <boost/thread/tss.hpp>

#include <algorithm>
#include <mutex>
#include <set>
#include <stdio.h>
#include <vector>

bool fDebug = false;
bool fPrintToConsole = false;
bool fLogTimestamps = false;
static volatile bool fPrintToDebugLog = true;

void setWriteToDebugLogFlag(bool settingValue)
{
    fPrintToDebugLog = settingValue;
}

LOG_FORMAT_WITH_TOSTRING(uint256)
LOG_FORMAT_WITH_TOSTRING(COutPoint)

namespace
{

FILE* fileout = nullptr;

boost::filesystem::path getDebugLogPath()
{
    return GetDataDir() / "debug.log";
}

/** Ensures that the logging system has been initialised once.  Returns
 *  true if either it is initialised now or was already before.  In case
 *  there is a recursive call (i.e. logging performed from inside the
 *  initialisation logic), it returns false to avoid a deadlock.  */
bool EnsureDebugPrintInitialized()
{
    static bool initialised = false;
    if (initialised)
        return true;

    static std::recursive_mutex mut;
    static bool inProgress = false;

    std::lock_guard<std::recursive_mutex> lock(mut);

    if (initialised)
        return true;

    if (inProgress)
        return false;

    inProgress = true;

    const boost::filesystem::path pathDebug = getDebugLogPath();
    fileout = fopen(pathDebug.string().c_str(), "a");
    if (fileout) setbuf(fileout, NULL); // unbuffered

    inProgress = false;
    initialised = true;

    return true;
}

bool DebugModeIsEnabled(const Settings& settings)
{
    const std::vector<std::string>& categories = settings.GetMultiParameter("-debug");
    const bool anyNegativeDebugCategory = std::find(categories.begin(), categories.end(), std::string("0")) != categories.end();
    return !(settings.GetBoolArg("-nodebug", false) || anyNegativeDebugCategory) && !categories.empty();
}

} // anonymous namespace

bool LogAcceptCategory(const char* category)
{
    if (category != NULL) {
        if (!fDebug)
            return false;

        // Give each thread quick access to -debug settings.
        static boost::thread_specific_ptr< std::set<std::string> > ptrCategory;
        if (ptrCategory.get() == NULL) {
            const std::vector<std::string>& categories = Settings::instance().GetMultiParameter("-debug");
            ptrCategory.reset(new std::set<std::string>(categories.begin(), categories.end()));
        }
        const std::set<std::string>& setCategories = *ptrCategory.get();

        // "1", "all" and a bare -debug enable every category
        if (setCategories.count(std::string("all")) ||
            setCategories.count(std::string("1")) ||
            setCategories.count(std::string("")))
            return true;

        return setCategories.count(std::string(category)) > 0;
    }
    return true;
}

int LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written

    const bool initFailed = !fPrintToConsole && fPrintToDebugLog && !EnsureDebugPrintInitialized();

    if (fPrintToConsole || initFailed) {
        // print to console
        ret = fwrite(str.data(), 1, str.size(), stdout);
        fflush(stdout);
    } else if (fPrintToDebugLog) {
        static bool fStartedNewLine = true;
        static std::mutex mutexDebugLog;

        if (fileout == NULL)
            return ret;

        std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);

        if (fLogTimestamps && fStartedNewLine)
            ret += fprintf(fileout, "%s ", DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime()).c_str());
        fStartedNewLine = !str.empty() && str[str.size() - 1] == '\n';

        ret += fwrite(str.data(), 1, str.size(), fileout);
    }

    return ret;
}

void SetLoggingAndDebugSettings()
{
    const Settings& settings = Settings::instance();
    fPrintToConsole = settings.GetBoolArg("-printtoconsole", false);
    fLogTimestamps = settings.GetBoolArg("-logtimestamps", true);
    fDebug = DebugModeIsEnabled(settings);

    if(fPrintToConsole)
    {
        setvbuf(stdout, NULL, _IOLBF, 0);
    }
}
