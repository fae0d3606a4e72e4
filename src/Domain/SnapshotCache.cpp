#include "SnapshotCache.h"

#include "Domain/WildcardPattern.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace Domain
{

std::string_view toString(CacheState state) noexcept
{
    switch (state)
    {
    case CacheState::Empty:
        return "Empty";
    case CacheState::Valid:
        return "Valid";
    case CacheState::Stale:
        return "Stale";
    case CacheState::Invalid:
        return "Invalid";
    }
    return "Unknown";
}

void OrderedIndex::add(const std::string& key, const std::string& id)
{
    auto [it, inserted] = idsByKey.try_emplace(key);
    if (inserted)
    {
        keys.push_back(key);
    }
    it->second.push_back(id);
}

std::shared_ptr<const Snapshot> Snapshot::build(std::vector<Record> records)
{
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->records.reserve(records.size());
    snapshot->positionById.reserve(records.size());

    for (auto& record : records)
    {
        if (snapshot->positionById.contains(record.id))
        {
            spdlog::debug("SnapshotCache: dropping duplicate id '{}'", record.id);
            continue;
        }

        const std::size_t position = snapshot->records.size();
        snapshot->positionById.emplace(record.id, position);
        snapshot->byName.add(record.name, record.id);
        snapshot->byOwner.add(record.owner, record.id);

        for (const auto& port : record.ports)
        {
            if (snapshot->idByPort.insert_or_assign(port, record.id).second)
            {
                snapshot->portKeys.push_back(port);
            }
        }

        snapshot->records.push_back(std::move(record));
    }

    return snapshot;
}

const Record* Snapshot::find(const std::string& id) const
{
    auto it = positionById.find(id);
    if (it == positionById.end())
    {
        return nullptr;
    }
    return &records[it->second];
}

SnapshotCache::SnapshotCache(std::chrono::milliseconds ttl) : m_Snapshot(Snapshot::build({})), m_Ttl(ttl)
{
    spdlog::debug("SnapshotCache: created with {}ms TTL", m_Ttl.count());
}

bool SnapshotCache::isValid() const
{
    return state() == CacheState::Valid;
}

CacheState SnapshotCache::state() const
{
    const auto now = Clock::now();
    std::shared_lock lock(m_SnapshotMutex);
    return stateLocked(now);
}

CacheState SnapshotCache::stateLocked(Clock::time_point now) const
{
    switch (m_Mark)
    {
    case Mark::Empty:
        return CacheState::Empty;
    case Mark::Invalidated:
        return CacheState::Invalid;
    case Mark::Refreshed:
        break;
    }

    if (!m_LastRefresh || (now - *m_LastRefresh) >= m_Ttl)
    {
        return CacheState::Stale;
    }
    return CacheState::Valid;
}

bool SnapshotCache::rebuild(std::vector<Record> records)
{
    std::unique_lock rebuilding(m_RebuildMutex, std::try_to_lock);
    if (!rebuilding.owns_lock())
    {
        spdlog::debug("SnapshotCache: rebuild already in progress, skipping");
        return false;
    }

    auto snapshot = Snapshot::build(std::move(records));
    const std::size_t count = snapshot->records.size();
    {
        std::lock_guard writer(m_WriterMutex);
        publish(std::move(snapshot), Mark::Refreshed);
    }

    spdlog::debug("SnapshotCache: rebuilt with {} records", count);
    return true;
}

std::vector<Record> SnapshotCache::search(std::string_view keyword) const
{
    const auto current = snapshot();
    const WildcardPattern pattern(keyword);

    if (pattern.matchesEverything())
    {
        return current->records;
    }

    std::vector<Record> results;
    std::vector<bool> emitted(current->records.size(), false);

    auto emit = [&](const std::string& id) {
        auto it = current->positionById.find(id);
        if (it == current->positionById.end() || emitted[it->second])
        {
            return;
        }
        emitted[it->second] = true;
        results.push_back(current->records[it->second]);
    };

    auto emitIndex = [&](const OrderedIndex& index) {
        for (const auto& key : index.keys)
        {
            if (!pattern.matches(key))
            {
                continue;
            }
            for (const auto& id : index.idsByKey.at(key))
            {
                emit(id);
            }
        }
    };

    for (const auto& record : current->records)
    {
        if (pattern.matches(record.id))
        {
            emit(record.id);
        }
    }

    emitIndex(current->byName);

    for (const auto& port : current->portKeys)
    {
        if (pattern.matches(port))
        {
            emit(current->idByPort.at(port));
        }
    }

    emitIndex(current->byOwner);

    return results;
}

std::optional<Record> SnapshotCache::findById(const std::string& id) const
{
    const auto current = snapshot();
    if (const Record* record = current->find(id))
    {
        return *record;
    }
    return std::nullopt;
}

std::optional<Record> SnapshotCache::findByPort(const std::string& port) const
{
    const auto current = snapshot();
    auto it = current->idByPort.find(port);
    if (it == current->idByPort.end())
    {
        return std::nullopt;
    }
    if (const Record* record = current->find(it->second))
    {
        return *record;
    }
    return std::nullopt;
}

namespace
{

[[nodiscard]] std::vector<Record> collect(const Snapshot& snapshot, const OrderedIndex& index, const std::string& key)
{
    std::vector<Record> results;
    auto it = index.idsByKey.find(key);
    if (it == index.idsByKey.end())
    {
        return results;
    }

    results.reserve(it->second.size());
    for (const auto& id : it->second)
    {
        if (const Record* record = snapshot.find(id))
        {
            results.push_back(*record);
        }
    }
    return results;
}

} // namespace

std::vector<Record> SnapshotCache::findByName(const std::string& name) const
{
    const auto current = snapshot();
    return collect(*current, current->byName, name);
}

std::vector<Record> SnapshotCache::findByOwner(const std::string& owner) const
{
    const auto current = snapshot();
    return collect(*current, current->byOwner, owner);
}

bool SnapshotCache::removeRecord(const std::string& id)
{
    std::lock_guard writer(m_WriterMutex);

    const auto current = snapshot();
    if (current->find(id) == nullptr)
    {
        return false;
    }

    std::vector<Record> remaining;
    remaining.reserve(current->records.size() - 1);
    std::ranges::copy_if(current->records, std::back_inserter(remaining), [&id](const Record& record) { return record.id != id; });

    publish(Snapshot::build(std::move(remaining)), std::nullopt);

    spdlog::debug("SnapshotCache: removed record '{}'", id);
    return true;
}

void SnapshotCache::invalidate()
{
    {
        std::unique_lock lock(m_SnapshotMutex);
        if (m_Mark == Mark::Empty)
        {
            return;
        }
        m_Mark = Mark::Invalidated;
    }
    spdlog::debug("SnapshotCache: invalidated");
}

void SnapshotCache::clear()
{
    std::lock_guard writer(m_WriterMutex);
    publish(Snapshot::build({}), Mark::Empty);
    spdlog::debug("SnapshotCache: cleared");
}

bool SnapshotCache::waitForValid(std::chrono::milliseconds timeout, std::chrono::milliseconds pollInterval) const
{
    const auto deadline = Clock::now() + timeout;
    const auto step = std::max(pollInterval, std::chrono::milliseconds(1));

    std::unique_lock lock(m_WaitMutex);
    while (!isValid())
    {
        const auto now = Clock::now();
        if (now >= deadline)
        {
            return false;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        m_SnapshotChanged.wait_for(lock, std::min(step, remaining + std::chrono::milliseconds(1)));
    }
    return true;
}

std::shared_ptr<const Snapshot> SnapshotCache::snapshot() const
{
    std::shared_lock lock(m_SnapshotMutex);
    return m_Snapshot;
}

std::size_t SnapshotCache::recordCount() const
{
    return snapshot()->records.size();
}

std::optional<SnapshotCache::Clock::time_point> SnapshotCache::lastRefreshTime() const
{
    std::shared_lock lock(m_SnapshotMutex);
    return m_LastRefresh;
}

std::chrono::milliseconds SnapshotCache::age() const
{
    const auto now = Clock::now();
    std::shared_lock lock(m_SnapshotMutex);
    if (!m_LastRefresh)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - *m_LastRefresh);
}

std::chrono::milliseconds SnapshotCache::ttl() const
{
    std::shared_lock lock(m_SnapshotMutex);
    return m_Ttl;
}

void SnapshotCache::setTtl(std::chrono::milliseconds ttl)
{
    {
        std::unique_lock lock(m_SnapshotMutex);
        m_Ttl = ttl;
    }
    spdlog::info("SnapshotCache: TTL changed to {}ms", ttl.count());
}

void SnapshotCache::publish(std::shared_ptr<const Snapshot> snapshot, std::optional<Mark> mark)
{
    {
        std::unique_lock lock(m_SnapshotMutex);
        m_Snapshot = std::move(snapshot);
        if (mark == Mark::Refreshed)
        {
            m_LastRefresh = Clock::now();
        }
        else if (mark == Mark::Empty)
        {
            m_LastRefresh.reset();
        }
        if (mark)
        {
            m_Mark = *mark;
        }
    }

    ++m_Generation;

    {
        std::lock_guard lock(m_WaitMutex);
    }
    m_SnapshotChanged.notify_all();
}

} // namespace Domain
