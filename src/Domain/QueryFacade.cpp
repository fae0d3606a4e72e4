#include "QueryFacade.h"

#include "Domain/WildcardPattern.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace Domain
{

std::string_view toString(QuerySource source) noexcept
{
    switch (source)
    {
    case QuerySource::Cache:
        return "Cache";
    case QuerySource::CacheAfterWait:
        return "CacheAfterWait";
    case QuerySource::StaleCache:
        return "StaleCache";
    case QuerySource::DirectFetch:
        return "DirectFetch";
    }
    return "Unknown";
}

QueryFacade::QueryFacade(SnapshotCache& cache, RefreshCoordinator& coordinator, std::shared_ptr<IRecordSource> source, CacheConfig config)
    : m_Cache(cache), m_Coordinator(coordinator), m_Source(std::move(source)), m_Config(config)
{
}

QueryResult QueryFacade::query(std::string_view keyword, bool allowFallback)
{
    if (m_Cache.isValid())
    {
        return {.records = m_Cache.search(keyword), .source = QuerySource::Cache};
    }

    if (!allowFallback)
    {
        return {.records = m_Cache.search(keyword), .source = QuerySource::StaleCache};
    }

    const CacheConfig cfg = config();

    // Without a running coordinator no refresh can land within the budget
    if (m_Coordinator.isRunning())
    {
        m_Coordinator.requestRefresh();
        if (m_Cache.waitForValid(cfg.fallbackWait, cfg.pollInterval))
        {
            return {.records = m_Cache.search(keyword), .source = QuerySource::CacheAfterWait};
        }
    }

    spdlog::info("QueryFacade: cache not valid after {}ms, querying source directly", cfg.fallbackWait.count());
    return directFetch(keyword);
}

void QueryFacade::setConfig(const CacheConfig& config)
{
    std::lock_guard lock(m_ConfigMutex);
    m_Config = config;
}

CacheConfig QueryFacade::config() const
{
    std::lock_guard lock(m_ConfigMutex);
    return m_Config;
}

QueryResult QueryFacade::directFetch(std::string_view keyword)
{
    QueryResult result{.records = {}, .source = QuerySource::DirectFetch};

    FetchResult fetched;
    try
    {
        fetched = m_Source->fetchAll();
    }
    catch (const std::exception& e)
    {
        fetched = FetchResult::error(e.what());
    }

    if (!fetched.success)
    {
        spdlog::warn("QueryFacade: direct fetch failed: {}", fetched.errorMessage);
        return result;
    }

    const WildcardPattern pattern(keyword);
    for (auto& record : fetched.records)
    {
        if (recordMatches(pattern, record))
        {
            result.records.push_back(std::move(record));
        }
    }
    return result;
}

} // namespace Domain
