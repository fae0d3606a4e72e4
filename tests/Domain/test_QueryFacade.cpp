/// @file test_QueryFacade.cpp
/// @brief Tests for Domain::QueryFacade cache-first lookups and direct fallback
///
/// Tests cover:
/// - Valid cache served directly
/// - Waiting for a refresh within the fallback budget
/// - Direct fetch when the cache cannot become valid in time
/// - Stale reads when fallback is not allowed
/// - Failure handling on the direct path

#include "Domain/QueryFacade.h"
#include "Mocks/MockProbes.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using Domain::CacheConfig;
using Domain::QueryFacade;
using Domain::QuerySource;
using Domain::RefreshCoordinator;
using Domain::SnapshotCache;
using TestMocks::makeRecord;
using TestMocks::MockRecordSource;

namespace
{

std::vector<Domain::Record> sampleRecords()
{
    return {
        makeRecord("1", "alpha", "root", {"80"}),
        makeRecord("2", "beta", "alice", {"8443"}),
        makeRecord("3", "gamma", "bob"),
    };
}

CacheConfig fastConfig()
{
    CacheConfig config;
    config.fallbackWait = 300ms;
    config.pollInterval = 20ms;
    return config;
}

std::vector<std::string> idsOf(const std::vector<Domain::Record>& records)
{
    std::vector<std::string> ids;
    for (const auto& record : records)
    {
        ids.push_back(record.id);
    }
    return ids;
}

} // namespace

// =============================================================================
// Cache Path
// =============================================================================

TEST(QueryFacadeTest, ValidCacheIsServedWithoutFetching)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    ASSERT_TRUE(cache.rebuild(sampleRecords()));

    const auto result = facade.query("alpha", true);

    EXPECT_EQ(result.source, QuerySource::Cache);
    EXPECT_EQ(idsOf(result.records), (std::vector<std::string>{"1"}));
    EXPECT_EQ(source->fetchCount(), 0);
}

TEST(QueryFacadeTest, EmptyKeywordReturnsEverything)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());
    ASSERT_TRUE(cache.rebuild(sampleRecords()));

    EXPECT_EQ(facade.query("", false).records.size(), 3U);
    EXPECT_EQ(facade.query("*", false).records.size(), 3U);
}

// =============================================================================
// Fallback Wait Path
// =============================================================================

TEST(QueryFacadeTest, WaitsForRunningCoordinatorRefresh)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    source->setDelay(100ms);
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    coordinator.start();
    const auto result = facade.query("beta", true);
    coordinator.stop();

    EXPECT_EQ(result.source, QuerySource::CacheAfterWait);
    EXPECT_EQ(idsOf(result.records), (std::vector<std::string>{"2"}));
}

TEST(QueryFacadeTest, InvalidatedCacheTriggersRefreshRequest)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    coordinator.start();
    ASSERT_TRUE(cache.waitForValid(2s, 10ms));
    const int fetchesBefore = source->fetchCount();

    cache.invalidate();
    const auto result = facade.query("gamma", true);
    coordinator.stop();

    EXPECT_EQ(result.source, QuerySource::CacheAfterWait);
    EXPECT_EQ(idsOf(result.records), (std::vector<std::string>{"3"}));
    EXPECT_GT(source->fetchCount(), fetchesBefore);
}

// =============================================================================
// Direct Fetch Path
// =============================================================================

TEST(QueryFacadeTest, SlowRefreshFallsBackToDirectFetch)
{
    SnapshotCache cache(10s);
    auto slowSource = std::make_shared<MockRecordSource>(sampleRecords());
    slowSource->setDelay(2s);
    auto directSource = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(slowSource, cache, 60s);
    QueryFacade facade(cache, coordinator, directSource, fastConfig());

    coordinator.start();
    const auto start = std::chrono::steady_clock::now();
    const auto result = facade.query("a", true);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.source, QuerySource::DirectFetch);
    EXPECT_GE(elapsed, 290ms);
    EXPECT_LT(elapsed, 1500ms);
    EXPECT_EQ(directSource->fetchCount(), 1);

    coordinator.stop();
}

TEST(QueryFacadeTest, DirectFetchDoesNotPopulateCache)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    const auto result = facade.query("", true);

    EXPECT_EQ(result.source, QuerySource::DirectFetch);
    EXPECT_EQ(result.records.size(), 3U);
    EXPECT_FALSE(cache.isValid());
    EXPECT_EQ(cache.recordCount(), 0U);
}

TEST(QueryFacadeTest, StoppedCoordinatorSkipsWait)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    CacheConfig config = fastConfig();
    config.fallbackWait = 5s;
    QueryFacade facade(cache, coordinator, source, config);

    const auto start = std::chrono::steady_clock::now();
    const auto result = facade.query("beta", true);

    EXPECT_EQ(result.source, QuerySource::DirectFetch);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(QueryFacadeTest, DirectFetchFiltersInSourceOrder)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(std::vector<Domain::Record>{
        makeRecord("10", "svc", "xz"),
        makeRecord("11", "xz", "root"),
        makeRecord("xz", "svc", "root"),
        makeRecord("12", "other", "root"),
    });
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    const auto result = facade.query("XZ", true);

    EXPECT_EQ(result.source, QuerySource::DirectFetch);
    EXPECT_EQ(idsOf(result.records), (std::vector<std::string>{"10", "11", "xz"}));
}

TEST(QueryFacadeTest, DirectFetchFailureYieldsEmptyResult)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    source->setFailure("denied");
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    const auto result = facade.query("alpha", true);

    EXPECT_EQ(result.source, QuerySource::DirectFetch);
    EXPECT_TRUE(result.records.empty());
}

// =============================================================================
// Stale Read Path
// =============================================================================

TEST(QueryFacadeTest, NoFallbackServesStaleData)
{
    SnapshotCache cache(50ms);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    ASSERT_TRUE(cache.rebuild(sampleRecords()));
    std::this_thread::sleep_for(80ms);
    ASSERT_FALSE(cache.isValid());

    const auto result = facade.query("alpha", false);

    EXPECT_EQ(result.source, QuerySource::StaleCache);
    EXPECT_EQ(idsOf(result.records), (std::vector<std::string>{"1"}));
    EXPECT_EQ(source->fetchCount(), 0);
}

TEST(QueryFacadeTest, NoFallbackOnEmptyCacheReturnsNothing)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>(sampleRecords());
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source, fastConfig());

    const auto result = facade.query("alpha", false);

    EXPECT_EQ(result.source, QuerySource::StaleCache);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(source->fetchCount(), 0);
}

// =============================================================================
// Configuration
// =============================================================================

TEST(QueryFacadeTest, ConfigCanBeReplaced)
{
    SnapshotCache cache(10s);
    auto source = std::make_shared<MockRecordSource>();
    RefreshCoordinator coordinator(source, cache, 60s);
    QueryFacade facade(cache, coordinator, source);

    EXPECT_EQ(facade.config().fallbackWait, 5000ms);
    EXPECT_EQ(facade.config().pollInterval, 100ms);

    facade.setConfig(fastConfig());
    EXPECT_EQ(facade.config().fallbackWait, 300ms);
}

TEST(QueryFacadeTest, SourceNamesAreReadable)
{
    EXPECT_EQ(Domain::toString(QuerySource::Cache), "Cache");
    EXPECT_EQ(Domain::toString(QuerySource::CacheAfterWait), "CacheAfterWait");
    EXPECT_EQ(Domain::toString(QuerySource::StaleCache), "StaleCache");
    EXPECT_EQ(Domain::toString(QuerySource::DirectFetch), "DirectFetch");
}
