// Benchmarks for the live record pipeline
//
// A refresh is one ProbeRecordSource::fetchAll(): process enumeration, the
// Netlink listening-socket query and the /proc fd scan that attributes sockets
// to PIDs. These run against the real machine, so absolute numbers vary.

#include "Domain/ProbeRecordSource.h"
#include "Domain/SnapshotCache.h"
#include "MemoryTracker.h"
#include "Platform/Factory.h"

#include <chrono>
#include <memory>
#include <utility>

#include <benchmark/benchmark.h>

#if defined(__linux__) && __has_include(<linux/inet_diag.h>) && __has_include(<linux/sock_diag.h>)
#include "Platform/Linux/ListeningSocketTable.h"
#endif

namespace
{

// Raw platform enumeration, ports included
static void BM_ProcessProbe_Enumerate(benchmark::State& state)
{
    auto probe = Platform::makeProcessProbe();

    BenchmarkUtils::MemoryDeltaTracker memTracker;

    for (auto _ : state)
    {
        auto result = probe->enumerate();
        benchmark::DoNotOptimize(result.processes.data());
    }

    state.counters["processes"] = benchmark::Counter(static_cast<double>(probe->enumerate().processes.size()));
    BenchmarkUtils::reportMemoryCounters(state);
    BenchmarkUtils::reportMemoryDelta(state, memTracker);
}
BENCHMARK(BM_ProcessProbe_Enumerate)->Unit(benchmark::kMillisecond);

// Enumeration plus conversion to records
static void BM_ProbeRecordSource_FetchAll(benchmark::State& state)
{
    Domain::ProbeRecordSource source(Platform::makeProcessProbe());

    for (auto _ : state)
    {
        auto result = source.fetchAll();
        if (!result.success)
        {
            state.SkipWithError(result.errorMessage.c_str());
            return;
        }
        benchmark::DoNotOptimize(result.records.data());
    }
}
BENCHMARK(BM_ProbeRecordSource_FetchAll)->Unit(benchmark::kMillisecond);

// What the refresh worker does each period
static void BM_ProbeRecordSource_FetchAndRebuild(benchmark::State& state)
{
    Domain::ProbeRecordSource source(Platform::makeProcessProbe());
    Domain::SnapshotCache cache(std::chrono::seconds(10));

    for (auto _ : state)
    {
        auto result = source.fetchAll();
        if (!result.success)
        {
            state.SkipWithError(result.errorMessage.c_str());
            return;
        }
        const bool rebuilt = cache.rebuild(std::move(result.records));
        benchmark::DoNotOptimize(rebuilt);
    }

    state.counters["records"] = benchmark::Counter(static_cast<double>(cache.recordCount()));
}
BENCHMARK(BM_ProbeRecordSource_FetchAndRebuild)->Unit(benchmark::kMillisecond);

#if defined(__linux__) && __has_include(<linux/inet_diag.h>) && __has_include(<linux/sock_diag.h>)

static void BM_ListeningSocketTable_Query(benchmark::State& state)
{
    Platform::ListeningSocketTable table;
    if (!table.isAvailable())
    {
        state.SkipWithError("Netlink INET_DIAG not available");
        return;
    }

    for (auto _ : state)
    {
        auto sockets = table.queryListeningSockets();
        benchmark::DoNotOptimize(sockets.data());
    }

    state.counters["sockets"] = benchmark::Counter(static_cast<double>(table.queryListeningSockets().size()));
}
BENCHMARK(BM_ListeningSocketTable_Query);

// Scans /proc/[pid]/fd/*, usually the dominant cost of port attribution
static void BM_ListeningSocketTable_BuildInodeToPidMap(benchmark::State& state)
{
    for (auto _ : state)
    {
        auto mapping = Platform::buildInodeToPidMap();
        benchmark::DoNotOptimize(mapping.size());
    }

    state.counters["mappings"] = benchmark::Counter(static_cast<double>(Platform::buildInodeToPidMap().size()));
}
BENCHMARK(BM_ListeningSocketTable_BuildInodeToPidMap)->Unit(benchmark::kMillisecond);

static void BM_ListeningSocketTable_GroupPortsByPid(benchmark::State& state)
{
    Platform::ListeningSocketTable table;
    if (!table.isAvailable())
    {
        state.SkipWithError("Netlink INET_DIAG not available");
        return;
    }

    const auto sockets = table.queryListeningSockets();
    const auto inodeToPid = Platform::buildInodeToPidMap();

    for (auto _ : state)
    {
        auto grouped = Platform::groupPortsByPid(sockets, inodeToPid);
        benchmark::DoNotOptimize(grouped.size());
    }
}
BENCHMARK(BM_ListeningSocketTable_GroupPortsByPid);

#endif // __linux__ && headers available

} // namespace
