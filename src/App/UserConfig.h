#pragma once

#include "Domain/CacheConfig.h"

#include <filesystem>
#include <optional>
#include <string>

namespace App
{

/// User configuration settings that persist across sessions
struct UserSettings
{
    // Cache tunables
    int ttlSeconds = Domain::Caching::TTL_SECONDS_DEFAULT;
    int refreshSeconds = Domain::Caching::REFRESH_SECONDS_DEFAULT;
    int fallbackWaitMs = Domain::Caching::FALLBACK_WAIT_MS_DEFAULT;
    int pollIntervalMs = Domain::Caching::POLL_INTERVAL_MS_DEFAULT;

    // Window state
    int windowWidth = 1100;
    int windowHeight = 640;
    std::optional<int> windowPosX;
    std::optional<int> windowPosY;
    bool windowMaximized = false;

    // Last keyword entered in the search box
    std::string lastKeyword;

    /// Cache tunables as a Domain::CacheConfig (values clamped).
    [[nodiscard]] auto cacheConfig() const -> Domain::CacheConfig;

    /// Store cache tunables from a Domain::CacheConfig (values clamped).
    void setCacheConfig(const Domain::CacheConfig& config);
};

/**
 * @brief Manages user configuration persistence
 *
 * Saves/loads user preferences to a TOML file in the platform-appropriate
 * config directory:
 * - Linux: $XDG_CONFIG_HOME/portscope/config.toml or ~/.config/portscope/config.toml
 */
class UserConfig
{
  public:
    /// Get the singleton instance, bound to the platform config directory
    static auto get() -> UserConfig&;

    /// Bind to an explicit config file path
    explicit UserConfig(std::filesystem::path configPath);
    ~UserConfig() = default;

    UserConfig(const UserConfig&) = delete;
    auto operator=(const UserConfig&) -> UserConfig& = delete;
    UserConfig(UserConfig&&) = delete;
    auto operator=(UserConfig&&) -> UserConfig& = delete;

    /// Load settings from config file (call on startup).
    /// A missing or malformed file leaves the defaults in place.
    void load();

    /// Save settings to config file
    void save() const;

    /// Get current settings
    [[nodiscard]] auto settings() const -> const UserSettings&
    {
        return m_Settings;
    }

    /// Get mutable settings reference (for modification)
    [[nodiscard]] auto settings() -> UserSettings&
    {
        return m_Settings;
    }

    /// Get the config file path
    [[nodiscard]] auto configPath() const -> const std::filesystem::path&
    {
        return m_ConfigPath;
    }

  private:
    std::filesystem::path m_ConfigPath;
    UserSettings m_Settings;
    bool m_IsLoaded = false;

    static auto getConfigDirectory() -> std::filesystem::path;
};

} // namespace App
