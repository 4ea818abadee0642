#include <test/test_only.h>
#include <init.h>

#include <DataDirectory.h>
#include <Logging.h>
#include <Settings.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <string>
#include <vector>

class InitTestFixture
{
private:
    const std::string dataDirectory_;

public:
    boost::filesystem::path configPath;

    InitTestFixture(
        ): dataDirectory_(GetDataDir().string())
        , configPath(GetDataDir() / "kaswallet.conf")
    {
    }
    ~InitTestFixture()
    {
        boost::filesystem::remove(configPath);
        fDebug = false;
        fPrintToConsole = false;
        Settings& settings = Settings::instance();
        settings.ClearParameter();
        settings.SetParameter("-datadir", dataDirectory_);
        ClearDatadirCache();
    }

    void WriteConfig(const std::string& contents)
    {
        boost::filesystem::ofstream stream(configPath);
        stream << contents;
    }

    bool Initialize(std::vector<std::string> arguments)
    {
        arguments.insert(arguments.begin(), "-datadir=" + dataDirectory_);
        arguments.insert(arguments.begin(), "kaswalletd");
        std::vector<const char*> argv;
        for (const std::string& argument: arguments)
        {
            argv.push_back(argument.c_str());
        }
        return InitializeSettings(static_cast<int>(argv.size()), &argv[0]);
    }
};

BOOST_FIXTURE_TEST_SUITE(InitTests, InitTestFixture)

BOOST_AUTO_TEST_CASE(missingConfigFileLeavesDefaults)
{
    BOOST_CHECK(Initialize({"-syncinterval=3"}));
    const Settings& settings = Settings::instance();
    BOOST_CHECK_EQUAL(settings.GetArg("-syncinterval", 10), 3);
    BOOST_CHECK_EQUAL(settings.GetArg("-coinbasematurity", 1000), 1000);
    BOOST_CHECK(!fDebug);
}

BOOST_AUTO_TEST_CASE(configFileValuesApplyBelowTheCommandLine)
{
    WriteConfig("syncinterval=30\ncoinbasematurity=50\nsignaturescheme=ecdsa\n");
    BOOST_CHECK(Initialize({"-syncinterval=5"}));
    const Settings& settings = Settings::instance();
    BOOST_CHECK_EQUAL(settings.GetArg("-syncinterval", 10), 5);
    BOOST_CHECK_EQUAL(settings.GetArg("-coinbasematurity", 1000), 50);
    BOOST_CHECK_EQUAL(settings.GetArg("-signaturescheme", "schnorr"), "ecdsa");
}

BOOST_AUTO_TEST_CASE(debugSwitchesComeFromTheConfigFile)
{
    WriteConfig("debug=sync\n");
    BOOST_CHECK(Initialize({}));
    BOOST_CHECK(fDebug);
    BOOST_CHECK(!fPrintToConsole);
}

BOOST_AUTO_TEST_CASE(negatedDebugDisablesLogging)
{
    BOOST_CHECK(Initialize({"-debug=sync", "-nodebug"}));
    BOOST_CHECK(!fDebug);
}

BOOST_AUTO_TEST_CASE(nonexistentDataDirectoryIsRejected)
{
    const boost::filesystem::path missing = GetDataDir() / "does_not_exist";
    std::vector<const char*> argv;
    const std::string datadirArgument = "-datadir=" + missing.string();
    argv.push_back("kaswalletd");
    argv.push_back(datadirArgument.c_str());
    BOOST_CHECK(!InitializeSettings(static_cast<int>(argv.size()), &argv[0]));
}

BOOST_AUTO_TEST_SUITE_END()
