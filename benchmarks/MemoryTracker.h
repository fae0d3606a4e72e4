// Memory tracking utilities for benchmarks
//
// Reads resident set size figures from /proc/self/status so benchmarks can
// report how much memory a snapshot or an enumeration pass costs.

#pragma once

#include <charconv>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <benchmark/benchmark.h>

namespace BenchmarkUtils
{

/// Memory figures from /proc/self/status, in bytes
struct MemoryStats
{
    std::uint64_t vmRSS = 0;  ///< Resident set size
    std::uint64_t vmHWM = 0;  ///< Peak resident set size (high water mark)
    std::uint64_t vmData = 0; ///< Data segment size (heap)

    [[nodiscard]] bool valid() const
    {
        return vmRSS > 0;
    }
};

/// Parse a "VmRSS:     12345 kB" line into bytes; leaves target unchanged on mismatch
inline void parseStatusLine(std::string_view line, std::string_view prefix, std::uint64_t& target)
{
    if (!line.starts_with(prefix))
    {
        return;
    }

    const auto pos = line.find_first_of("0123456789", prefix.size());
    if (pos == std::string_view::npos)
    {
        return;
    }

    std::uint64_t kib = 0;
    const auto result = std::from_chars(line.data() + pos, line.data() + line.size(), kib);
    if (result.ec == std::errc{})
    {
        target = kib * 1024;
    }
}

[[nodiscard]] inline auto readMemoryStats() -> MemoryStats
{
    MemoryStats stats;

    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
    {
        parseStatusLine(line, "VmRSS:", stats.vmRSS);
        parseStatusLine(line, "VmHWM:", stats.vmHWM);
        parseStatusLine(line, "VmData:", stats.vmData);
    }

    return stats;
}

/// RAII helper to measure memory change during a scope
class MemoryDeltaTracker
{
  public:
    MemoryDeltaTracker() : m_StartStats(readMemoryStats())
    {
    }

    [[nodiscard]] auto rssDelta() const -> std::int64_t
    {
        const auto current = readMemoryStats();
        return static_cast<std::int64_t>(current.vmRSS) - static_cast<std::int64_t>(m_StartStats.vmRSS);
    }

    [[nodiscard]] auto peakRssDelta() const -> std::int64_t
    {
        const auto current = readMemoryStats();
        return static_cast<std::int64_t>(current.vmHWM) - static_cast<std::int64_t>(m_StartStats.vmHWM);
    }

  private:
    MemoryStats m_StartStats;
};

/// Report absolute memory usage (MiB) as benchmark counters
inline void reportMemoryCounters(benchmark::State& state)
{
    const auto stats = readMemoryStats();
    if (stats.valid())
    {
        constexpr double MIB = 1024.0 * 1024.0;
        state.counters["rss_mb"] = benchmark::Counter(static_cast<double>(stats.vmRSS) / MIB);
        state.counters["heap_mb"] = benchmark::Counter(static_cast<double>(stats.vmData) / MIB);
        state.counters["peak_rss_mb"] = benchmark::Counter(static_cast<double>(stats.vmHWM) / MIB);
    }
}

/// Report memory growth (KiB) since the tracker was created
inline void reportMemoryDelta(benchmark::State& state, const MemoryDeltaTracker& tracker)
{
    state.counters["rss_delta_kb"] = benchmark::Counter(static_cast<double>(tracker.rssDelta()) / 1024.0);
    state.counters["peak_delta_kb"] = benchmark::Counter(static_cast<double>(tracker.peakRssDelta()) / 1024.0);
}

} // namespace BenchmarkUtils
