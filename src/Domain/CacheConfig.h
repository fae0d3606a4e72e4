#pragma once

#include <algorithm>
#include <chrono>

namespace Domain::Caching
{

// Snapshot time-to-live (seconds)
inline constexpr int TTL_SECONDS_DEFAULT = 10;
inline constexpr int TTL_SECONDS_MIN = 1;
inline constexpr int TTL_SECONDS_MAX = 3600;

// Periodic refresh cadence (seconds)
inline constexpr int REFRESH_SECONDS_DEFAULT = 10;
inline constexpr int REFRESH_SECONDS_MIN = 1;
inline constexpr int REFRESH_SECONDS_MAX = 3600;

// Query fallback wait budget (milliseconds)
inline constexpr int FALLBACK_WAIT_MS_DEFAULT = 5000;
inline constexpr int FALLBACK_WAIT_MS_MIN = 0;
inline constexpr int FALLBACK_WAIT_MS_MAX = 30000;

// Validity re-check interval while waiting (milliseconds)
inline constexpr int POLL_INTERVAL_MS_DEFAULT = 100;
inline constexpr int POLL_INTERVAL_MS_MIN = 10;
inline constexpr int POLL_INTERVAL_MS_MAX = 1000;

template<typename T> [[nodiscard]] constexpr T clampTtlSeconds(T value)
{
    return std::clamp(value, static_cast<T>(TTL_SECONDS_MIN), static_cast<T>(TTL_SECONDS_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampRefreshSeconds(T value)
{
    return std::clamp(value, static_cast<T>(REFRESH_SECONDS_MIN), static_cast<T>(REFRESH_SECONDS_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampFallbackWaitMs(T value)
{
    return std::clamp(value, static_cast<T>(FALLBACK_WAIT_MS_MIN), static_cast<T>(FALLBACK_WAIT_MS_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampPollIntervalMs(T value)
{
    return std::clamp(value, static_cast<T>(POLL_INTERVAL_MS_MIN), static_cast<T>(POLL_INTERVAL_MS_MAX));
}

} // namespace Domain::Caching

namespace Domain
{

/// Tunables shared by the snapshot cache, refresh coordinator and query facade.
struct CacheConfig
{
    std::chrono::milliseconds ttl{std::chrono::seconds(Caching::TTL_SECONDS_DEFAULT)};
    std::chrono::milliseconds refreshPeriod{std::chrono::seconds(Caching::REFRESH_SECONDS_DEFAULT)};
    std::chrono::milliseconds fallbackWait{Caching::FALLBACK_WAIT_MS_DEFAULT};
    std::chrono::milliseconds pollInterval{Caching::POLL_INTERVAL_MS_DEFAULT};
};

} // namespace Domain
