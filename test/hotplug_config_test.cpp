#include <fstream>
#include <stdexcept>
#include <gtest/gtest.h>

#include "hotplug_config.hpp"

class HotplugConfigTest : public ::testing::Test {
protected:
    std::string WriteConfig(const std::string &name, const std::string &contents)
    {
        std::string path = ::testing::TempDir() + name;
        std::ofstream file(path, std::ios::out | std::ios::trunc);
        file << contents;
        return path;
    }
};

TEST_F(HotplugConfigTest, LoadsAllKeys)
{
    std::string path = WriteConfig("hotplug_full.yaml",
        "vid: \"0402\"\n"
        "pid: 0x0204\n"
        "match:\n"
        "  bus: 3\n"
        "  serial: A1B2\n"
        "poll_interval_ms: 250\n"
        "settle_time_ms: 100\n"
        "allow_dummy_fallback: true\n"
        "log_level: debug\n"
        "log_file: /tmp/hotplug.log\n");

    HotplugConfig config = LoadHotplugConfig(path);

    EXPECT_EQ(GetIntParam(config.m_params, "idVendor"), 0x0402);
    EXPECT_EQ(GetIntParam(config.m_params, "idProduct"), 0x0204);
    EXPECT_EQ(GetIntParam(config.m_params, "bus"), 3);
    EXPECT_EQ(ScannerParamToString(config.m_params.at("serial")), "A1B2");
    EXPECT_EQ(config.m_pollInterval, std::chrono::milliseconds(250));
    EXPECT_EQ(config.m_settleTime, std::chrono::milliseconds(100));
    EXPECT_TRUE(config.m_allowDummyFallback);
    EXPECT_EQ(config.m_logLevel, HOTPLUG_LOG_LEVEL_DEBUG);
    EXPECT_EQ(config.m_logFile, "/tmp/hotplug.log");
}

TEST_F(HotplugConfigTest, UnquotedIdIsHex)
{
    std::string path = WriteConfig("hotplug_unquoted.yaml", "vid: 0402\npid: 1234\n");

    HotplugConfig config = LoadHotplugConfig(path);

    EXPECT_EQ(GetIntParam(config.m_params, "idVendor"), 0x0402);
    EXPECT_EQ(GetIntParam(config.m_params, "idProduct"), 0x1234);
}

TEST_F(HotplugConfigTest, DefaultsForEmptyMap)
{
    std::string path = WriteConfig("hotplug_defaults.yaml", "{}\n");

    HotplugConfig config = LoadHotplugConfig(path);

    EXPECT_TRUE(config.m_params.empty());
    EXPECT_EQ(config.m_pollInterval, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.m_settleTime, std::chrono::milliseconds(500));
    EXPECT_FALSE(config.m_allowDummyFallback);
    EXPECT_EQ(config.m_logLevel, HOTPLUG_LOG_LEVEL_WARNING);
    EXPECT_TRUE(config.m_logFile.empty());
}

TEST_F(HotplugConfigTest, MissingFileThrows)
{
    EXPECT_THROW(LoadHotplugConfig(::testing::TempDir() + "does_not_exist.yaml"), std::invalid_argument);
}

TEST_F(HotplugConfigTest, BadVendorIdThrows)
{
    std::string path = WriteConfig("hotplug_bad_vid.yaml", "vid: zz\n");

    EXPECT_THROW(LoadHotplugConfig(path), std::invalid_argument);
}

TEST_F(HotplugConfigTest, BadLogLevelThrows)
{
    std::string path = WriteConfig("hotplug_bad_level.yaml", "log_level: loud\n");

    EXPECT_THROW(LoadHotplugConfig(path), std::invalid_argument);
}

TEST_F(HotplugConfigTest, NegativeIntervalThrows)
{
    std::string path = WriteConfig("hotplug_negative.yaml", "poll_interval_ms: -5\n");

    EXPECT_THROW(LoadHotplugConfig(path), std::invalid_argument);
}

TEST_F(HotplugConfigTest, MatchMustBeMap)
{
    std::string path = WriteConfig("hotplug_bad_match.yaml", "match: [1, 2]\n");

    EXPECT_THROW(LoadHotplugConfig(path), std::invalid_argument);
}
