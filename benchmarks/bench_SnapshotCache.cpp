// Benchmarks for Domain/SnapshotCache
//
// Rebuild cost bounds how long a refresh holds the writer lock; search and the
// exact lookups are what every query pays while the cache is valid.
// Records are synthetic so results are comparable across machines.

#include "Domain/Record.h"
#include "Domain/SnapshotCache.h"
#include "Domain/WildcardPattern.h"
#include "MemoryTracker.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

namespace
{

[[nodiscard]] std::vector<Domain::Record> makeRecords(std::size_t count)
{
    static const std::vector<std::string> NAMES = {"nginx", "sshd", "postgres", "redis-server", "node", "python3", "java", "dockerd"};
    static const std::vector<std::string> OWNERS = {"root", "www-data", "postgres", "alice", "bob"};

    std::vector<Domain::Record> records;
    records.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        Domain::Record record;
        record.id = std::to_string(1000 + i);
        record.name = NAMES[i % NAMES.size()];
        record.owner = OWNERS[i % OWNERS.size()];
        // Roughly one process in four is listening
        if (i % 4 == 0)
        {
            record.ports.push_back(std::to_string(10000 + i));
            if (i % 8 == 0)
            {
                record.ports.push_back(std::to_string(20000 + i));
            }
        }
        record.detail = "/usr/bin/" + record.name + " --worker " + std::to_string(i);
        records.push_back(std::move(record));
    }
    return records;
}

// Full rebuild: table copy plus all four indices
static void BM_SnapshotCache_Rebuild(benchmark::State& state)
{
    const auto records = makeRecords(static_cast<std::size_t>(state.range(0)));
    Domain::SnapshotCache cache(std::chrono::seconds(10));

    BenchmarkUtils::MemoryDeltaTracker memTracker;

    for (auto _ : state)
    {
        const bool rebuilt = cache.rebuild(records);
        benchmark::DoNotOptimize(rebuilt);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    BenchmarkUtils::reportMemoryCounters(state);
    BenchmarkUtils::reportMemoryDelta(state, memTracker);
}
BENCHMARK(BM_SnapshotCache_Rebuild)->RangeMultiplier(4)->Range(64, 4096);

// Substring search that matches names (scans every key set)
static void BM_SnapshotCache_SearchSubstring(benchmark::State& state)
{
    Domain::SnapshotCache cache(std::chrono::seconds(10));
    static_cast<void>(cache.rebuild(makeRecords(static_cast<std::size_t>(state.range(0)))));

    for (auto _ : state)
    {
        auto results = cache.search("redis");
        benchmark::DoNotOptimize(results.data());
    }

    state.counters["matches"] = benchmark::Counter(static_cast<double>(cache.search("redis").size()));
}
BENCHMARK(BM_SnapshotCache_SearchSubstring)->RangeMultiplier(4)->Range(64, 4096);

// Wildcard pattern with several segments
static void BM_SnapshotCache_SearchWildcard(benchmark::State& state)
{
    Domain::SnapshotCache cache(std::chrono::seconds(10));
    static_cast<void>(cache.rebuild(makeRecords(static_cast<std::size_t>(state.range(0)))));

    for (auto _ : state)
    {
        auto results = cache.search("po*gr*s");
        benchmark::DoNotOptimize(results.data());
    }
}
BENCHMARK(BM_SnapshotCache_SearchWildcard)->RangeMultiplier(4)->Range(64, 4096);

// Empty keyword returns the whole table
static void BM_SnapshotCache_SearchAll(benchmark::State& state)
{
    Domain::SnapshotCache cache(std::chrono::seconds(10));
    static_cast<void>(cache.rebuild(makeRecords(static_cast<std::size_t>(state.range(0)))));

    for (auto _ : state)
    {
        auto results = cache.search("");
        benchmark::DoNotOptimize(results.data());
    }
}
BENCHMARK(BM_SnapshotCache_SearchAll)->RangeMultiplier(4)->Range(64, 4096);

// Exact lookups go through the hash indices and should stay flat as the table grows
static void BM_SnapshotCache_FindByPort(benchmark::State& state)
{
    const auto count = static_cast<std::size_t>(state.range(0));
    Domain::SnapshotCache cache(std::chrono::seconds(10));
    static_cast<void>(cache.rebuild(makeRecords(count)));

    const std::string port = std::to_string(10000 + ((count / 2) / 4 * 4));

    for (auto _ : state)
    {
        auto record = cache.findByPort(port);
        benchmark::DoNotOptimize(record.has_value());
    }
}
BENCHMARK(BM_SnapshotCache_FindByPort)->RangeMultiplier(4)->Range(64, 4096);

// Pattern matching in isolation
static void BM_WildcardPattern_Matches(benchmark::State& state)
{
    const Domain::WildcardPattern pattern("red*serv");
    const std::string text = "redis-server";

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(pattern.matches(text));
    }
}
BENCHMARK(BM_WildcardPattern_Matches);

} // namespace
