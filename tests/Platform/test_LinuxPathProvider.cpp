/// @file test_LinuxPathProvider.cpp
/// @brief Integration tests for Platform::LinuxPathProvider

#include <gtest/gtest.h>

#if defined(__linux__) && __has_include(<unistd.h>)

#include "Platform/Factory.h"
#include "Platform/Linux/LinuxPathProvider.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace Platform
{
namespace
{

/// Sets an environment variable for the lifetime of the guard and restores it afterwards.
class ScopedEnv
{
  public:
    ScopedEnv(const char* name, const char* value) : m_Name(name)
    {
        if (const char* previous = std::getenv(name)) // NOLINT(concurrency-mt-unsafe)
        {
            m_Saved = previous;
        }
        if (value != nullptr)
        {
            setenv(name, value, 1);
        }
        else
        {
            unsetenv(name);
        }
    }

    ~ScopedEnv()
    {
        if (m_Saved)
        {
            setenv(m_Name.c_str(), m_Saved->c_str(), 1);
        }
        else
        {
            unsetenv(m_Name.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
    ScopedEnv(ScopedEnv&&) = delete;
    ScopedEnv& operator=(ScopedEnv&&) = delete;

  private:
    std::string m_Name;
    std::optional<std::string> m_Saved;
};

TEST(LinuxPathProviderTest, FactoryReturnsProvider)
{
    auto provider = makePathProvider();
    ASSERT_NE(provider, nullptr);
}

TEST(LinuxPathProviderTest, ConfigDirUsesXdgConfigHome)
{
    const ScopedEnv xdg("XDG_CONFIG_HOME", "/tmp/portscope_xdg_test");
    LinuxPathProvider provider;

    EXPECT_EQ(provider.getUserConfigDir(), std::filesystem::path("/tmp/portscope_xdg_test") / "portscope");
}

TEST(LinuxPathProviderTest, ConfigDirFallsBackToHome)
{
    const ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
    const ScopedEnv home("HOME", "/tmp/portscope_home_test");
    LinuxPathProvider provider;

    EXPECT_EQ(provider.getUserConfigDir(), std::filesystem::path("/tmp/portscope_home_test") / ".config" / "portscope");
}

TEST(LinuxPathProviderTest, EmptyXdgIsIgnored)
{
    const ScopedEnv xdg("XDG_CONFIG_HOME", "");
    const ScopedEnv home("HOME", "/tmp/portscope_home_test");
    LinuxPathProvider provider;

    EXPECT_EQ(provider.getUserConfigDir().filename(), "portscope");
    EXPECT_NE(provider.getUserConfigDir().string().find(".config"), std::string::npos);
}

TEST(LinuxPathProviderTest, RelativeXdgIsIgnored)
{
    const ScopedEnv xdg("XDG_CONFIG_HOME", "relative/config");
    const ScopedEnv home("HOME", "/tmp/portscope_home_test");
    LinuxPathProvider provider;

    EXPECT_EQ(provider.getUserConfigDir(), std::filesystem::path("/tmp/portscope_home_test") / ".config" / "portscope");
}

TEST(LinuxPathProviderTest, StateDirUsesXdgStateHome)
{
    const ScopedEnv xdg("XDG_STATE_HOME", "/tmp/portscope_state_test");
    LinuxPathProvider provider;

    EXPECT_EQ(provider.getUserStateDir(), std::filesystem::path("/tmp/portscope_state_test") / "portscope");
}

TEST(LinuxPathProviderTest, StateDirFallsBackToLocalState)
{
    const ScopedEnv xdg("XDG_STATE_HOME", nullptr);
    const ScopedEnv home("HOME", "/tmp/portscope_home_test");
    LinuxPathProvider provider;

    EXPECT_EQ(provider.getUserStateDir(), std::filesystem::path("/tmp/portscope_home_test") / ".local" / "state" / "portscope");
}

TEST(LinuxPathProviderTest, ConfigAndStateDirsDiffer)
{
    const ScopedEnv xdgConfig("XDG_CONFIG_HOME", nullptr);
    const ScopedEnv xdgState("XDG_STATE_HOME", nullptr);
    const ScopedEnv home("HOME", "/tmp/portscope_home_test");
    LinuxPathProvider provider;

    EXPECT_NE(provider.getUserConfigDir(), provider.getUserStateDir());
}

} // namespace
} // namespace Platform

#endif
