#include <gtest/gtest.h>

#include "sysconf/sysconf.hpp"
#include "TempDir.hpp"

#include <stdlib.h>

#include <string>

namespace {

class ConfigTest : public ::testing::Test {
protected:
    ConfigTest() { sysconf_set_config_dir(dir.path()); }
    ~ConfigTest() override { sysconf_set_config_dir(""); }

    void setUint(const std::string &key, uint64_t val)
    {
        plist_t p = plist_new_uint(val);
        sysconf_set_value(key, p);
        plist_free(p);
    }

    TempDir dir;
};

} // namespace

TEST_F(ConfigTest, DefaultsAreWrittenOnFirstLoad)
{
    Config config;
    config.load();

    EXPECT_FALSE(config.useCustomToolPath);
    EXPECT_EQ(config.customToolPath, "");
    EXPECT_EQ(config.defaultTcpipPort, DEFAULT_TCPIP_PORT);
    EXPECT_EQ(config.refreshIntervalMs, (uint32_t)DEFAULT_REFRESH_INTERVAL_MS);
    EXPECT_EQ(config.missedPollsBeforeRemoval, 1u);
    EXPECT_FALSE(config.autoConnectLastDevices);

    plist_t p = sysconf_get_value("defaultTcpipPort");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(plist_get_node_type(p), PLIST_UINT);
    plist_free(p);
}

TEST_F(ConfigTest, SavedValuesAreLoadedBack)
{
    {
        Config config;
        config.useCustomToolPath = true;
        config.customToolPath = "/opt/platform-tools/adb";
        config.defaultTcpipPort = 5556;
        config.refreshIntervalMs = 3000;
        config.missedPollsBeforeRemoval = 3;
        config.autoConnectLastDevices = true;
        config.save();
    }

    Config config;
    config.load();
    EXPECT_TRUE(config.useCustomToolPath);
    EXPECT_EQ(config.customToolPath, "/opt/platform-tools/adb");
    EXPECT_EQ(config.defaultTcpipPort, 5556);
    EXPECT_EQ(config.refreshIntervalMs, 3000u);
    EXPECT_EQ(config.missedPollsBeforeRemoval, 3u);
    EXPECT_TRUE(config.autoConnectLastDevices);
}

TEST_F(ConfigTest, OutOfRangeValuesAreClamped)
{
    setUint("defaultTcpipPort", 70000);
    setUint("refreshInterval", 10);
    setUint("missedPollsBeforeRemoval", 0);

    Config config;
    config.load();
    EXPECT_EQ(config.defaultTcpipPort, DEFAULT_TCPIP_PORT);
    EXPECT_EQ(config.refreshIntervalMs, 250u);
    EXPECT_EQ(config.missedPollsBeforeRemoval, 1u);
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault)
{
    plist_t p = plist_new_string("yes");
    sysconf_set_value("autoConnectLastDevices", p);
    plist_free(p);

    EXPECT_FALSE(sysconf_try_getconfig_bool("autoConnectLastDevices", false));
    EXPECT_EQ(sysconf_try_getconfig_string("customToolPath", "/x/adb"), "/x/adb");
    EXPECT_EQ(sysconf_try_getconfig_string("customToolPath", "/y/adb"), "/x/adb");
}

TEST_F(ConfigTest, EffectiveToolPathPrecedence)
{
    Config config;
    EXPECT_EQ(config.effectiveToolPath(), "");

    config.customToolPath = "/opt/adb";
    EXPECT_EQ(config.effectiveToolPath(), "");
    config.useCustomToolPath = true;
    EXPECT_EQ(config.effectiveToolPath(), "/opt/adb");

    config.toolPathOverride = "/cli/adb";
    EXPECT_EQ(config.effectiveToolPath(), "/cli/adb");
}

TEST_F(ConfigTest, ConfigDirOverride)
{
    EXPECT_EQ(sysconf_get_config_dir(), dir.path());
    EXPECT_EQ(sysconf_get_config_path("Config.plist"), dir.file("Config.plist"));

    sysconf_set_config_dir("");
    setenv("ADBHUB_CONFIG_DIR", "/tmp/adbhub-env-dir", 1);
    EXPECT_EQ(sysconf_get_config_dir(), "/tmp/adbhub-env-dir");
    unsetenv("ADBHUB_CONFIG_DIR");
}

TEST_F(ConfigTest, NestedConfigDirIsCreated)
{
    sysconf_set_config_dir(dir.file("a/b/c"));
    EXPECT_EQ(sysconf_get_config_path("Config.plist"), dir.file("a/b/c/Config.plist"));

    Config config;
    config.load();
    EXPECT_EQ(config.defaultTcpipPort, DEFAULT_TCPIP_PORT);
}
