#include "LinuxPathProvider.h"

#include <cstdlib>
#include <filesystem>
#include <string_view>

namespace Platform
{

namespace
{

constexpr std::string_view APP_DIR_NAME = "portscope";

/// secure_getenv ignores the environment in setuid/setgid programs.
[[nodiscard]] const char* getEnvSafe(const char* name)
{
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    return secure_getenv(name);
#else
    // NOLINTNEXTLINE(concurrency-mt-unsafe) - fallback when secure_getenv unavailable
    return std::getenv(name);
#endif
}

/// $<xdgVar>/portscope when set and absolute, else $HOME/<homeRelative>/portscope,
/// else the current directory.
[[nodiscard]] std::filesystem::path resolveXdgDir(const char* xdgVar, const std::filesystem::path& homeRelative)
{
    if (const char* xdg = getEnvSafe(xdgVar))
    {
        // XDG base directories must be absolute; relative values are ignored
        if (xdg[0] == '/')
        {
            return std::filesystem::path(xdg) / APP_DIR_NAME;
        }
    }

    if (const char* home = getEnvSafe("HOME"))
    {
        if (home[0] != '\0')
        {
            return std::filesystem::path(home) / homeRelative / APP_DIR_NAME;
        }
    }

    return std::filesystem::current_path();
}

} // namespace

std::filesystem::path LinuxPathProvider::getUserConfigDir() const
{
    return resolveXdgDir("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path LinuxPathProvider::getUserStateDir() const
{
    return resolveXdgDir("XDG_STATE_HOME", std::filesystem::path(".local") / "state");
}

} // namespace Platform
