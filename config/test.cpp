#define BOOST_TEST_MODULE Suites
#include <boost/test/unit_test.hpp>

#include <stdlib.h>

#include <filesystem>
#include <fstream>

#include "Config.hpp"

using namespace std::chrono_literals;

namespace {
    // properties file removed on scope exit
    struct TmpFile
    {
        const std::string m_Name;

        TmpFile(const std::string& aName, const std::string& aData)
        : m_Name((std::filesystem::temp_directory_path() / aName).string())
        {
            std::ofstream sStream(m_Name);
            sStream << aData;
        }
        ~TmpFile() { std::filesystem::remove(m_Name); }
    };

    struct Env
    {
        const std::string m_Name;

        Env(const std::string& aName, const std::string& aValue)
        : m_Name(aName)
        {
            setenv(aName.c_str(), aValue.c_str(), 1);
        }
        ~Env() { unsetenv(m_Name.c_str()); }
    };
} // namespace

BOOST_AUTO_TEST_SUITE(Config)
BOOST_AUTO_TEST_CASE(parser)
{
    std::string sInput  = "foo.bar = a=b=c";
    auto        sResult = Config::PropertyFile::parse(sInput);
    BOOST_CHECK_EQUAL(sResult.first, "foo.bar");
    BOOST_CHECK_EQUAL(sResult.second, "a=b=c");

    BOOST_CHECK(Config::PropertyFile::parse("  # comment").first.empty());
    BOOST_CHECK(Config::PropertyFile::parse("   ").first.empty());
    BOOST_CHECK_THROW(Config::PropertyFile::parse("no value"), std::invalid_argument);
}
BOOST_AUTO_TEST_CASE(basic)
{
    Config::Manager sManager("");
    sManager.properties().set("cache.ttl", "5s");
    BOOST_CHECK_EQUAL("5s", sManager.get("cache.ttl", "1s"));
    BOOST_CHECK_EQUAL("foo", sManager.get("cache.some.param", "foo"));
    BOOST_CHECK_THROW(sManager.get("cache.some.param"), std::invalid_argument);
}
BOOST_AUTO_TEST_CASE(ctx)
{
    {
        Config::Manager sManager("");
        sManager.properties().set("cache.ttl", "5s");
        Config::Context sCtx1("main");
        {
            Config::Context sCtx1("users");
            BOOST_CHECK_EQUAL("5s", sManager.get("cache.ttl", "1s"));
            BOOST_CHECK_THROW(sManager.get("cache.some.param"), std::invalid_argument);

            sManager.properties().set("main:cache.some.param", "from_main");
            BOOST_CHECK_EQUAL("from_main", sManager.get("cache.some.param"));
            BOOST_CHECK_EQUAL(Config::Context::get(), "main.users");
        }
    }
    BOOST_CHECK_EQUAL(Config::Context::get(), "");
}
BOOST_AUTO_TEST_CASE(wildcard)
{
    Config::Manager sManager("");
    sManager.properties().set("*.max_stale", "wild");
    {
        Config::Context sCtx1("main");
        {
            Config::Context sCtx1("users");
            BOOST_CHECK_EQUAL("wild", sManager.get("cache.max_stale"));
        }
    }
}
BOOST_AUTO_TEST_CASE(environment)
{
    Config::Manager sManager("");
    sManager.properties().set("main:cache.ttl", "5s");
    Config::Context sCtx("main");
    BOOST_CHECK_EQUAL("5s", sManager.get("cache.ttl"));

    Env sEnv("MAIN__CACHE_TTL", "7s");
    BOOST_CHECK_EQUAL("7s", sManager.get("cache.ttl"));
    BOOST_CHECK_EQUAL(sManager.duration("cache.ttl").count(), 7000);
}
BOOST_AUTO_TEST_CASE(read_files)
{
    Env     sHost("STALECACHE_TEST_HOST", "redis-master");
    TmpFile sFile1("__stalecache_a.prop", "file.a = 123\n# comment\n\nfoo.bar = ${STALECACHE_TEST_HOST}:6379\nfile.b = 1\n");
    TmpFile sFile2("__stalecache_b.prop", "file.b = 456");

    Env             sProperties("PROPERTIES", sFile1.m_Name + ":" + sFile2.m_Name);
    Config::Manager sManager;
    BOOST_CHECK_EQUAL("123", sManager.get("file.a"));
    BOOST_CHECK_EQUAL("456", sManager.get("file.b"));

    // check expand environment
    BOOST_CHECK_EQUAL("redis-master:6379", sManager.get("foo.bar"));

    BOOST_CHECK_THROW(Config::Manager("/nonexistent/__stalecache.prop"), std::runtime_error);
}
BOOST_AUTO_TEST_CASE(numbers)
{
    BOOST_CHECK_EQUAL(Config::parseNumber<unsigned>(" 42 "), 42u);
    BOOST_CHECK_THROW(Config::parseNumber<unsigned>("42x"), std::invalid_argument);
    BOOST_CHECK_THROW(Config::parseNumber<unsigned>(""), std::invalid_argument);

    BOOST_CHECK_EQUAL(Config::parseDuration("250").count(), 250);
    BOOST_CHECK_EQUAL(Config::parseDuration("250ms").count(), 250);
    BOOST_CHECK_EQUAL(Config::parseDuration("30s").count(), 30000);
    BOOST_CHECK_EQUAL(Config::parseDuration("5 m").count(), 300000);
    BOOST_CHECK_EQUAL(Config::parseDuration("1h").count(), 3600000);
    BOOST_CHECK_THROW(Config::parseDuration("1d"), std::invalid_argument);
    BOOST_CHECK_THROW(Config::parseDuration("s"), std::invalid_argument);

    Config::Manager sManager("");
    sManager.properties().set("workers", "4");
    sManager.properties().set("ttl", "2s");
    BOOST_CHECK_EQUAL(sManager.number<unsigned>("workers"), 4u);
    BOOST_CHECK_EQUAL(sManager.number<unsigned>("absent", 3u), 3u);
    BOOST_CHECK_EQUAL(sManager.duration("ttl").count(), 2000);
    BOOST_CHECK_EQUAL(sManager.duration("absent", 100ms).count(), 100);
    BOOST_CHECK_THROW(sManager.duration("absent"), std::invalid_argument);
}
BOOST_AUTO_TEST_SUITE_END()
