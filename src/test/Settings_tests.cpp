#include <test/test_only.h>
#include <Settings.h>

#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

struct SettingsTestContainer
{
    CopyableSettings settings;

    SettingsTestContainer(
        ): settings()
    {
    }

    void ResetArgs(const std::string& commandLineArguments)
    {
        std::vector<std::string> arguments;
        if (!commandLineArguments.empty())
            boost::split(arguments, commandLineArguments, boost::is_space(), boost::token_compress_on);
        arguments.insert(arguments.begin(), "kaswalletd");

        std::vector<const char*> argv;
        for (const std::string& argument: arguments)
        {
            argv.push_back(argument.c_str());
        }
        settings.ParseParameters(static_cast<int>(argv.size()), &argv[0]);
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsTests, SettingsTestContainer)

BOOST_AUTO_TEST_CASE(boolArgumentsHonourTheNoPrefix)
{
    ResetArgs("-usechangeaddress");
    BOOST_CHECK(settings.GetBoolArg("-usechangeaddress", false));
    BOOST_CHECK(!settings.GetBoolArg("-usechange", false));

    ResetArgs("-usechangeaddress=0");
    BOOST_CHECK(!settings.GetBoolArg("-usechangeaddress", true));

    ResetArgs("-nousechangeaddress");
    BOOST_CHECK(!settings.GetBoolArg("-usechangeaddress", true));

    ResetArgs("-usechangeaddress -nousechangeaddress");
    BOOST_CHECK(!settings.GetBoolArg("-usechangeaddress", true));

    ResetArgs("--usechangeaddress=1");
    BOOST_CHECK(settings.GetBoolArg("-usechangeaddress", false));
}

BOOST_AUTO_TEST_CASE(stringArgumentsFallBackToTheDefault)
{
    ResetArgs("");
    BOOST_CHECK_EQUAL(settings.GetArg("-signaturescheme", "schnorr"), "schnorr");

    ResetArgs("-signaturescheme=ecdsa");
    BOOST_CHECK_EQUAL(settings.GetArg("-signaturescheme", "schnorr"), "ecdsa");

    ResetArgs("-signaturescheme=");
    BOOST_CHECK_EQUAL(settings.GetArg("-signaturescheme", "schnorr"), "");
}

BOOST_AUTO_TEST_CASE(integerArgumentsParseOrBecomeZero)
{
    ResetArgs("");
    BOOST_CHECK_EQUAL(settings.GetArg("-syncinterval", 10), 10);

    ResetArgs("-syncinterval=30 -coinbasematurity=100");
    BOOST_CHECK_EQUAL(settings.GetArg("-syncinterval", 10), 30);
    BOOST_CHECK_EQUAL(settings.GetArg("-coinbasematurity", 1000), 100);

    ResetArgs("-syncinterval=often");
    BOOST_CHECK_EQUAL(settings.GetArg("-syncinterval", 10), 0);
}

BOOST_AUTO_TEST_CASE(parsingStopsAtTheFirstNonOption)
{
    const char* argv[] = {"kaswalletd", "-a", "-maxfee=5", "-maxfee=7", "positional", "-b"};
    settings.ParseParameters(6, argv);
    BOOST_CHECK(settings.ParameterIsSet("-a"));
    BOOST_CHECK(!settings.ParameterIsSet("-b"));
    BOOST_CHECK_EQUAL(settings.GetParameter("-maxfee"), "7");
    BOOST_CHECK_EQUAL(settings.GetMultiParameter("-maxfee").size(), 2u);
}

BOOST_AUTO_TEST_CASE(softSetArgumentsDoNotOverrideExplicitOnes)
{
    ResetArgs("-syncinterval=5");
    BOOST_CHECK(!settings.SoftSetArg("-syncinterval", "60"));
    BOOST_CHECK(settings.SoftSetBoolArg("-usechangeaddress", true));
    BOOST_CHECK_EQUAL(settings.GetArg("-syncinterval", 10), 5);
    BOOST_CHECK(settings.GetBoolArg("-usechangeaddress", false));

    settings.ForceRemoveArg("-syncinterval");
    BOOST_CHECK(!settings.ParameterIsSet("-syncinterval"));
}

BOOST_AUTO_TEST_CASE(commandLineTakesPrecedenceOverTheConfigFile)
{
    ResetArgs("-maxfee=3");
    std::istringstream config("maxfee=9\nsignaturescheme=ecdsa\n");
    settings.ReadConfigStream(config);
    BOOST_CHECK_EQUAL(settings.GetArg("-maxfee", 0), 3);
    BOOST_CHECK_EQUAL(settings.GetArg("-signaturescheme", "schnorr"), "ecdsa");
}

BOOST_AUTO_TEST_SUITE_END()
