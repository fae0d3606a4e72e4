/// @file test_UserConfig.cpp
/// @brief Tests for App::UserSettings defaults and App::UserConfig TOML persistence

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "App/UserConfig.h"
#include "Domain/CacheConfig.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace App
{
namespace
{

// ========== Test Fixtures ==========

/// Creates a temporary config directory for each test
class UserConfigPersistenceTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        m_TempDir = std::filesystem::temp_directory_path() / "portscope_test_config";
        m_TempDir += std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
        std::filesystem::create_directories(m_TempDir);

        m_ConfigPath = m_TempDir / "config.toml";
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_TempDir, ec);
    }

    void writeConfigFile(const std::string& content)
    {
        std::ofstream file(m_ConfigPath);
        ASSERT_TRUE(file.is_open()) << "Failed to create test config file";
        file << content;
    }

    [[nodiscard]] auto readConfigFile() const -> std::string
    {
        std::ifstream file(m_ConfigPath);
        if (!file.is_open())
        {
            return "";
        }
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path m_TempDir;
    std::filesystem::path m_ConfigPath;
};

// ========== UserSettings Defaults ==========

TEST(UserSettingsTest, DefaultCacheTunables)
{
    const UserSettings settings;
    EXPECT_EQ(settings.ttlSeconds, Domain::Caching::TTL_SECONDS_DEFAULT);
    EXPECT_EQ(settings.refreshSeconds, Domain::Caching::REFRESH_SECONDS_DEFAULT);
    EXPECT_EQ(settings.fallbackWaitMs, Domain::Caching::FALLBACK_WAIT_MS_DEFAULT);
    EXPECT_EQ(settings.pollIntervalMs, Domain::Caching::POLL_INTERVAL_MS_DEFAULT);
}

TEST(UserSettingsTest, DefaultWindowHasNoPosition)
{
    const UserSettings settings;
    EXPECT_FALSE(settings.windowPosX.has_value());
    EXPECT_FALSE(settings.windowPosY.has_value());
    EXPECT_FALSE(settings.windowMaximized);
}

TEST(UserSettingsTest, CacheConfigMatchesDomainDefaults)
{
    const UserSettings settings;
    const Domain::CacheConfig expected;
    const auto config = settings.cacheConfig();

    EXPECT_EQ(config.ttl, expected.ttl);
    EXPECT_EQ(config.refreshPeriod, expected.refreshPeriod);
    EXPECT_EQ(config.fallbackWait, expected.fallbackWait);
    EXPECT_EQ(config.pollInterval, expected.pollInterval);
}

TEST(UserSettingsTest, CacheConfigClampsOutOfRangeFields)
{
    UserSettings settings;
    settings.ttlSeconds = 0;
    settings.pollIntervalMs = 1;
    settings.fallbackWaitMs = 999'999;

    const auto config = settings.cacheConfig();
    EXPECT_EQ(config.ttl, std::chrono::seconds(Domain::Caching::TTL_SECONDS_MIN));
    EXPECT_EQ(config.pollInterval, std::chrono::milliseconds(Domain::Caching::POLL_INTERVAL_MS_MIN));
    EXPECT_EQ(config.fallbackWait, std::chrono::milliseconds(Domain::Caching::FALLBACK_WAIT_MS_MAX));
}

TEST(UserSettingsTest, SetCacheConfigStoresWholeUnits)
{
    UserSettings settings;
    Domain::CacheConfig config;
    config.ttl = std::chrono::seconds(30);
    config.refreshPeriod = std::chrono::seconds(5);
    config.fallbackWait = std::chrono::milliseconds(250);
    config.pollInterval = std::chrono::milliseconds(20);

    settings.setCacheConfig(config);

    EXPECT_EQ(settings.ttlSeconds, 30);
    EXPECT_EQ(settings.refreshSeconds, 5);
    EXPECT_EQ(settings.fallbackWaitMs, 250);
    EXPECT_EQ(settings.pollIntervalMs, 20);
}

// ========== Load ==========

TEST_F(UserConfigPersistenceTest, MissingFileKeepsDefaults)
{
    UserConfig config(m_ConfigPath);
    config.load();

    EXPECT_EQ(config.settings().ttlSeconds, Domain::Caching::TTL_SECONDS_DEFAULT);
    EXPECT_TRUE(config.settings().lastKeyword.empty());
    EXPECT_FALSE(std::filesystem::exists(m_ConfigPath));
}

TEST_F(UserConfigPersistenceTest, LoadsAllSections)
{
    writeConfigFile(R"(
[cache]
ttl_seconds = 30
refresh_seconds = 15
fallback_wait_ms = 2000
poll_interval_ms = 50

[window]
width = 1024
height = 768
x = 40
y = 60
maximized = true

[search]
last_keyword = "ssh*"
)");

    UserConfig config(m_ConfigPath);
    config.load();
    const auto& settings = config.settings();

    EXPECT_EQ(settings.ttlSeconds, 30);
    EXPECT_EQ(settings.refreshSeconds, 15);
    EXPECT_EQ(settings.fallbackWaitMs, 2000);
    EXPECT_EQ(settings.pollIntervalMs, 50);
    EXPECT_EQ(settings.windowWidth, 1024);
    EXPECT_EQ(settings.windowHeight, 768);
    EXPECT_EQ(settings.windowPosX.value_or(0), 40);
    EXPECT_EQ(settings.windowPosY.value_or(0), 60);
    EXPECT_TRUE(settings.windowMaximized);
    EXPECT_EQ(settings.lastKeyword, "ssh*");
}

TEST_F(UserConfigPersistenceTest, PartialFileKeepsDefaultsForMissingKeys)
{
    writeConfigFile("[cache]\nttl_seconds = 20\n");

    UserConfig config(m_ConfigPath);
    config.load();

    EXPECT_EQ(config.settings().ttlSeconds, 20);
    EXPECT_EQ(config.settings().refreshSeconds, Domain::Caching::REFRESH_SECONDS_DEFAULT);
    EXPECT_EQ(config.settings().fallbackWaitMs, Domain::Caching::FALLBACK_WAIT_MS_DEFAULT);
}

TEST_F(UserConfigPersistenceTest, OutOfRangeValuesAreClampedOnLoad)
{
    writeConfigFile(R"(
[cache]
ttl_seconds = 0
refresh_seconds = 100000
fallback_wait_ms = -5
poll_interval_ms = 99999999999

[window]
width = 10
height = 999999
x = 500000
)");

    UserConfig config(m_ConfigPath);
    config.load();
    const auto& settings = config.settings();

    EXPECT_EQ(settings.ttlSeconds, Domain::Caching::TTL_SECONDS_MIN);
    EXPECT_EQ(settings.refreshSeconds, Domain::Caching::REFRESH_SECONDS_MAX);
    EXPECT_EQ(settings.fallbackWaitMs, Domain::Caching::FALLBACK_WAIT_MS_MIN);
    // Does not fit an int: falls back to the default
    EXPECT_EQ(settings.pollIntervalMs, Domain::Caching::POLL_INTERVAL_MS_DEFAULT);
    EXPECT_EQ(settings.windowWidth, 200);
    EXPECT_EQ(settings.windowHeight, 16'384);
    EXPECT_FALSE(settings.windowPosX.has_value());
}

TEST_F(UserConfigPersistenceTest, WrongTypesAreIgnored)
{
    writeConfigFile(R"(
[cache]
ttl_seconds = "thirty"

[window]
maximized = "yes"
)");

    UserConfig config(m_ConfigPath);
    config.load();

    EXPECT_EQ(config.settings().ttlSeconds, Domain::Caching::TTL_SECONDS_DEFAULT);
    EXPECT_FALSE(config.settings().windowMaximized);
}

TEST_F(UserConfigPersistenceTest, ParseErrorFallsBackToDefaults)
{
    writeConfigFile("[cache\nttl_seconds = = 3\n");

    UserConfig config(m_ConfigPath);
    EXPECT_NO_THROW(config.load());

    EXPECT_EQ(config.settings().ttlSeconds, Domain::Caching::TTL_SECONDS_DEFAULT);
    EXPECT_EQ(config.settings().windowWidth, UserSettings{}.windowWidth);
}

TEST_F(UserConfigPersistenceTest, LoadRunsOnce)
{
    writeConfigFile("[cache]\nttl_seconds = 20\n");

    UserConfig config(m_ConfigPath);
    config.load();
    config.settings().ttlSeconds = 45;
    config.load();

    EXPECT_EQ(config.settings().ttlSeconds, 45);
}

// ========== Save ==========

TEST_F(UserConfigPersistenceTest, SaveThenLoadPreservesSettings)
{
    {
        UserConfig config(m_ConfigPath);
        auto& settings = config.settings();
        settings.ttlSeconds = 42;
        settings.refreshSeconds = 7;
        settings.fallbackWaitMs = 1500;
        settings.pollIntervalMs = 25;
        settings.windowWidth = 900;
        settings.windowHeight = 500;
        settings.windowPosX = -20;
        settings.windowPosY = 30;
        settings.windowMaximized = true;
        settings.lastKeyword = "nginx";
        config.save();
    }

    UserConfig reloaded(m_ConfigPath);
    reloaded.load();
    const auto& settings = reloaded.settings();

    EXPECT_EQ(settings.ttlSeconds, 42);
    EXPECT_EQ(settings.refreshSeconds, 7);
    EXPECT_EQ(settings.fallbackWaitMs, 1500);
    EXPECT_EQ(settings.pollIntervalMs, 25);
    EXPECT_EQ(settings.windowWidth, 900);
    EXPECT_EQ(settings.windowHeight, 500);
    EXPECT_EQ(settings.windowPosX.value_or(0), -20);
    EXPECT_EQ(settings.windowPosY.value_or(0), 30);
    EXPECT_TRUE(settings.windowMaximized);
    EXPECT_EQ(settings.lastKeyword, "nginx");
}

TEST_F(UserConfigPersistenceTest, SaveClampsValues)
{
    UserConfig config(m_ConfigPath);
    config.settings().ttlSeconds = 100'000;
    config.settings().pollIntervalMs = 0;
    config.save();

    UserConfig reloaded(m_ConfigPath);
    reloaded.load();
    EXPECT_EQ(reloaded.settings().ttlSeconds, Domain::Caching::TTL_SECONDS_MAX);
    EXPECT_EQ(reloaded.settings().pollIntervalMs, Domain::Caching::POLL_INTERVAL_MS_MIN);
}

TEST_F(UserConfigPersistenceTest, SaveOmitsUnsetWindowPosition)
{
    UserConfig config(m_ConfigPath);
    config.save();

    const std::string content = readConfigFile();
    EXPECT_NE(content.find("[cache]"), std::string::npos);
    EXPECT_NE(content.find("[window]"), std::string::npos);
    EXPECT_NE(content.find("[search]"), std::string::npos);
    EXPECT_EQ(content.find("x = "), std::string::npos);
}

TEST_F(UserConfigPersistenceTest, SaveCreatesMissingDirectory)
{
    const auto nestedPath = m_TempDir / "nested" / "portscope" / "config.toml";
    UserConfig config(nestedPath);
    config.save();

    EXPECT_TRUE(std::filesystem::exists(nestedPath));
}

} // namespace
} // namespace App
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
