#define BOOST_TEST_MODULE kaswallet Test Suite

#include <test/gmock_boost_integration.h>

#include <DataDirectory.h>
#include <Logging.h>
#include <Settings.h>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

struct TestingSetup
{
    boost::filesystem::path pathTemp;

    TestingSetup(): pathTemp()
    {
        setWriteToDebugLogFlag(false);
        pathTemp = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("test_kaswallet_%%%%-%%%%-%%%%");
        boost::filesystem::create_directories(pathTemp);
        Settings::instance().SetParameter("-datadir", pathTemp.string());
        ClearDatadirCache();
    }
    ~TestingSetup()
    {
        ClearDatadirCache();
        boost::filesystem::remove_all(pathTemp);
    }
};

BOOST_GLOBAL_FIXTURE(TestingSetup);
