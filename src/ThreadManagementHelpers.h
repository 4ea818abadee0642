#ifndef THREAD_MANAGEMENT_HELPERS_H
#define THREAD_MANAGEMENT_HELPERS_H
#include <Logging.h>

#include <exception>
#include <string>

#include <boost/thread/exceptions.hpp>

void PrintExceptionContinue(const std::exception* pex, const char* pszThread);
void RenameThread(const char* name);

/**
 * Standard wrapper for thread functions: names the thread, logs its
 * lifetime and reports anything that escapes it.
 * Use it like:
 *    boost::function<void()> f = boost::bind(&SyncEngine::ThreadSyncLoop, &engine, intervalMillis);
 *    threadGroup.create_thread(boost::bind(&TraceThread<boost::function<void()> >, "sync", f));
 */
template <typename Callable>
void TraceThread(const char* name, Callable func)
{
    std::string s = tfm::format("kaswallet-%s", name);
    RenameThread(s.c_str());
    try {
        LogPrintf("%s thread start\n", name);
        func();
        LogPrintf("%s thread exit\n", name);
    } catch (const boost::thread_interrupted&) {
        LogPrintf("%s thread interrupt\n", name);
        throw;
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, name);
        throw;
    } catch (...) {
        PrintExceptionContinue(NULL, name);
        throw;
    }
}

#endif //THREAD_MANAGEMENT_HELPERS_H
