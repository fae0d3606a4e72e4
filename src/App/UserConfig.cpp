#include "UserConfig.h"

#include "Domain/Numeric.h"
#include "Platform/Factory.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <toml++/toml.hpp>

namespace App
{

namespace
{

constexpr int WINDOW_DIMENSION_MIN = 200;
constexpr int WINDOW_DIMENSION_MAX = 16'384;
constexpr int WINDOW_POS_ABS_MAX = 100'000;

[[nodiscard]] bool isSaneWindowPositionComponent(int value)
{
    return std::abs(value) <= WINDOW_POS_ABS_MAX;
}

[[nodiscard]] int clampWindowDimension(int value)
{
    return std::clamp(value, WINDOW_DIMENSION_MIN, WINDOW_DIMENSION_MAX);
}

template<typename Rep, typename Period> [[nodiscard]] int toIntOr(std::chrono::duration<Rep, Period> value, int fallback)
{
    return Domain::Numeric::narrowOr<int>(value.count(), fallback);
}

} // namespace

auto UserSettings::cacheConfig() const -> Domain::CacheConfig
{
    return {
        .ttl = std::chrono::seconds(Domain::Caching::clampTtlSeconds(ttlSeconds)),
        .refreshPeriod = std::chrono::seconds(Domain::Caching::clampRefreshSeconds(refreshSeconds)),
        .fallbackWait = std::chrono::milliseconds(Domain::Caching::clampFallbackWaitMs(fallbackWaitMs)),
        .pollInterval = std::chrono::milliseconds(Domain::Caching::clampPollIntervalMs(pollIntervalMs)),
    };
}

void UserSettings::setCacheConfig(const Domain::CacheConfig& config)
{
    using std::chrono::duration_cast;
    using std::chrono::seconds;

    ttlSeconds = Domain::Caching::clampTtlSeconds(toIntOr(duration_cast<seconds>(config.ttl), Domain::Caching::TTL_SECONDS_DEFAULT));
    refreshSeconds = Domain::Caching::clampRefreshSeconds(
        toIntOr(duration_cast<seconds>(config.refreshPeriod), Domain::Caching::REFRESH_SECONDS_DEFAULT));
    fallbackWaitMs = Domain::Caching::clampFallbackWaitMs(toIntOr(config.fallbackWait, Domain::Caching::FALLBACK_WAIT_MS_DEFAULT));
    pollIntervalMs = Domain::Caching::clampPollIntervalMs(toIntOr(config.pollInterval, Domain::Caching::POLL_INTERVAL_MS_DEFAULT));
}

auto UserConfig::get() -> UserConfig&
{
    static UserConfig instance(getConfigDirectory() / "config.toml");
    return instance;
}

UserConfig::UserConfig(std::filesystem::path configPath) : m_ConfigPath(std::move(configPath))
{
    spdlog::debug("UserConfig: config path {}", m_ConfigPath.string());
}

auto UserConfig::getConfigDirectory() -> std::filesystem::path
{
    auto pathProvider = Platform::makePathProvider();
    return pathProvider->getUserConfigDir();
}

void UserConfig::load()
{
    if (m_IsLoaded)
    {
        return;
    }
    m_IsLoaded = true;

    if (!std::filesystem::exists(m_ConfigPath))
    {
        spdlog::info("UserConfig: no config file found at {}, using defaults", m_ConfigPath.string());
        return;
    }

    try
    {
        auto config = toml::parse_file(m_ConfigPath.string());

        // Cache tunables. Out-of-range values are clamped; values that do not fit an int fall back to the default.
        if (auto val = config["cache"]["ttl_seconds"].value<std::int64_t>())
        {
            m_Settings.ttlSeconds =
                Domain::Caching::clampTtlSeconds(Domain::Numeric::narrowOr<int>(*val, Domain::Caching::TTL_SECONDS_DEFAULT));
        }
        if (auto val = config["cache"]["refresh_seconds"].value<std::int64_t>())
        {
            m_Settings.refreshSeconds =
                Domain::Caching::clampRefreshSeconds(Domain::Numeric::narrowOr<int>(*val, Domain::Caching::REFRESH_SECONDS_DEFAULT));
        }
        if (auto val = config["cache"]["fallback_wait_ms"].value<std::int64_t>())
        {
            m_Settings.fallbackWaitMs =
                Domain::Caching::clampFallbackWaitMs(Domain::Numeric::narrowOr<int>(*val, Domain::Caching::FALLBACK_WAIT_MS_DEFAULT));
        }
        if (auto val = config["cache"]["poll_interval_ms"].value<std::int64_t>())
        {
            m_Settings.pollIntervalMs =
                Domain::Caching::clampPollIntervalMs(Domain::Numeric::narrowOr<int>(*val, Domain::Caching::POLL_INTERVAL_MS_DEFAULT));
        }

        // Window state
        if (auto val = config["window"]["width"].value<std::int64_t>())
        {
            m_Settings.windowWidth = clampWindowDimension(Domain::Numeric::narrowOr<int>(*val, WINDOW_DIMENSION_MAX));
        }
        if (auto val = config["window"]["height"].value<std::int64_t>())
        {
            m_Settings.windowHeight = clampWindowDimension(Domain::Numeric::narrowOr<int>(*val, WINDOW_DIMENSION_MAX));
        }
        if (auto val = config["window"]["x"].value<std::int64_t>())
        {
            const int x = Domain::Numeric::narrowOr<int>(*val, WINDOW_POS_ABS_MAX + 1);
            if (isSaneWindowPositionComponent(x))
            {
                m_Settings.windowPosX = x;
            }
            else
            {
                m_Settings.windowPosX.reset();
            }
        }
        if (auto val = config["window"]["y"].value<std::int64_t>())
        {
            const int y = Domain::Numeric::narrowOr<int>(*val, WINDOW_POS_ABS_MAX + 1);
            if (isSaneWindowPositionComponent(y))
            {
                m_Settings.windowPosY = y;
            }
            else
            {
                m_Settings.windowPosY.reset();
            }
        }
        if (auto val = config["window"]["maximized"].value<bool>())
        {
            m_Settings.windowMaximized = *val;
        }

        if (auto keyword = config["search"]["last_keyword"].value<std::string>())
        {
            m_Settings.lastKeyword = *keyword;
        }

        spdlog::info("UserConfig: loaded config from {}", m_ConfigPath.string());
    }
    catch (const toml::parse_error& err)
    {
        m_Settings = UserSettings{};
        spdlog::error("UserConfig: failed to parse config file {}: {}", m_ConfigPath.string(), err.what());
    }
}

void UserConfig::save() const
{
    // Ensure config directory exists
    const std::filesystem::path configDir = m_ConfigPath.parent_path();
    if (!configDir.empty() && !std::filesystem::exists(configDir))
    {
        std::error_code ec;
        std::filesystem::create_directories(configDir, ec);
        if (ec)
        {
            spdlog::error("UserConfig: failed to create config directory {}: {}", configDir.string(), ec.message());
            return;
        }
    }

    auto windowTable = toml::table{
        {"width", clampWindowDimension(m_Settings.windowWidth)},
        {"height", clampWindowDimension(m_Settings.windowHeight)},
        {"maximized", m_Settings.windowMaximized},
    };

    if (m_Settings.windowPosX.has_value() && isSaneWindowPositionComponent(*m_Settings.windowPosX))
    {
        windowTable.insert("x", *m_Settings.windowPosX);
    }
    if (m_Settings.windowPosY.has_value() && isSaneWindowPositionComponent(*m_Settings.windowPosY))
    {
        windowTable.insert("y", *m_Settings.windowPosY);
    }

    auto config = toml::table{
        {"cache",
         toml::table{
             {"ttl_seconds", Domain::Caching::clampTtlSeconds(m_Settings.ttlSeconds)},
             {"refresh_seconds", Domain::Caching::clampRefreshSeconds(m_Settings.refreshSeconds)},
             {"fallback_wait_ms", Domain::Caching::clampFallbackWaitMs(m_Settings.fallbackWaitMs)},
             {"poll_interval_ms", Domain::Caching::clampPollIntervalMs(m_Settings.pollIntervalMs)},
         }},
        {"window", windowTable},
        {"search", toml::table{{"last_keyword", m_Settings.lastKeyword}}},
    };

    std::ofstream file(m_ConfigPath);
    if (!file)
    {
        spdlog::error("UserConfig: failed to open config file for writing: {}", m_ConfigPath.string());
        return;
    }

    file << "# PortScope user configuration\n";
    file << "# This file is auto-generated. Manual edits are preserved.\n";
    file << "# Notes:\n";
    file << "# - cache: ttl_seconds is how long a snapshot stays valid; refresh_seconds is the background refresh cadence.\n";
    file << "# - cache: fallback_wait_ms bounds how long a query waits for a refresh before fetching directly.\n\n";
    file << config;

    spdlog::info("UserConfig: saved config to {}", m_ConfigPath.string());
}

} // namespace App
