#pragma once

#include "Domain/CacheConfig.h"
#include "Domain/IRecordSource.h"
#include "Domain/RefreshCoordinator.h"
#include "Domain/SnapshotCache.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace Domain
{

/// Which path produced a query result.
enum class QuerySource : std::uint8_t
{
    Cache,          // Cache was valid
    CacheAfterWait, // Cache became valid within the fallback budget
    StaleCache,     // Cache invalid, fallback not allowed
    DirectFetch,    // One-shot fetch filtered in-process
};

[[nodiscard]] std::string_view toString(QuerySource source) noexcept;

struct QueryResult
{
    std::vector<Record> records;
    QuerySource source = QuerySource::Cache;
};

/// Keyword lookups over the snapshot cache with a bounded fallback to the record source.
class QueryFacade
{
  public:
    QueryFacade(SnapshotCache& cache, RefreshCoordinator& coordinator, std::shared_ptr<IRecordSource> source, CacheConfig config = {});

    /// Never blocks longer than the fallback budget plus one direct fetch.
    [[nodiscard]] QueryResult query(std::string_view keyword, bool allowFallback);

    /// Fallback budget and poll interval are read from config; other fields are ignored.
    void setConfig(const CacheConfig& config);
    [[nodiscard]] CacheConfig config() const;

  private:
    [[nodiscard]] QueryResult directFetch(std::string_view keyword);

    SnapshotCache& m_Cache;
    RefreshCoordinator& m_Coordinator;
    std::shared_ptr<IRecordSource> m_Source;

    mutable std::mutex m_ConfigMutex;
    CacheConfig m_Config;
};

} // namespace Domain
