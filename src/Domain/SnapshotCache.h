#pragma once

#include "Domain/Record.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Domain
{

/// Validity of the cached snapshot.
/// Empty and Invalid mean "do not trust"; Stale data is servable but due a refresh.
enum class CacheState : std::uint8_t
{
    Empty,
    Valid,
    Stale,
    Invalid,
};

[[nodiscard]] std::string_view toString(CacheState state) noexcept;

/// Key -> ids, with keys kept in first-appearance order and ids in record order.
struct OrderedIndex
{
    std::vector<std::string> keys;
    std::unordered_map<std::string, std::vector<std::string>> idsByKey;

    void add(const std::string& key, const std::string& id);
};

/// Immutable record table plus the indices derived from it.
/// Published whole; readers never see a partially built snapshot.
struct Snapshot
{
    std::vector<Record> records;                              // Rebuild order
    std::unordered_map<std::string, std::size_t> positionById; // id -> index into records
    OrderedIndex byName;
    OrderedIndex byOwner;
    std::vector<std::string> portKeys;                         // First-appearance order
    std::unordered_map<std::string, std::string> idByPort;     // Last writer wins

    /// Build a snapshot from records. Records repeating an earlier id are dropped.
    [[nodiscard]] static std::shared_ptr<const Snapshot> build(std::vector<Record> records);

    [[nodiscard]] const Record* find(const std::string& id) const;
};

/// Thread-safe snapshot cache with name/owner/port indices and TTL-based validity.
///
/// Writers build a new immutable Snapshot and swap it in under a short exclusive
/// lock; readers take a shared_ptr copy and search without holding any lock.
class SnapshotCache
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit SnapshotCache(std::chrono::milliseconds ttl);
    ~SnapshotCache() = default;

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;
    SnapshotCache(SnapshotCache&&) = delete;
    SnapshotCache& operator=(SnapshotCache&&) = delete;

    /// True iff the last refresh succeeded, was not invalidated, and is younger than the TTL.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] CacheState state() const;

    /// Replace table and indices, mark Valid and stamp the refresh time.
    /// Returns false without touching anything if another rebuild is in flight.
    /// A concurrent removeRecord or clear only delays the swap.
    bool rebuild(std::vector<Record> records);

    /// Keyword search over id, name, port and owner (in that order), each record at most once.
    /// An empty keyword or "*" returns every record in snapshot order.
    [[nodiscard]] std::vector<Record> search(std::string_view keyword) const;

    [[nodiscard]] std::optional<Record> findById(const std::string& id) const;
    [[nodiscard]] std::optional<Record> findByPort(const std::string& port) const;
    [[nodiscard]] std::vector<Record> findByName(const std::string& name) const;
    [[nodiscard]] std::vector<Record> findByOwner(const std::string& owner) const;

    /// Drop one record and reindex the rest. Validity and refresh time are left alone.
    /// Returns true if the record existed.
    bool removeRecord(const std::string& id);

    /// Mark Invalid, keeping the data readable.
    void invalidate();

    /// Drop everything and return to Empty.
    void clear();

    /// Block until the cache is valid or timeout elapses. Woken by every rebuild,
    /// re-checked at least every pollInterval.
    [[nodiscard]] bool waitForValid(std::chrono::milliseconds timeout, std::chrono::milliseconds pollInterval) const;

    /// Current snapshot (never null).
    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

    [[nodiscard]] std::size_t recordCount() const;
    [[nodiscard]] std::optional<Clock::time_point> lastRefreshTime() const;

    /// Time since the last successful rebuild, zero when never refreshed.
    [[nodiscard]] std::chrono::milliseconds age() const;

    [[nodiscard]] std::chrono::milliseconds ttl() const;
    void setTtl(std::chrono::milliseconds ttl);

    /// Incremented by every rebuild, removal and clear.
    [[nodiscard]] std::uint64_t generation() const noexcept
    {
        return m_Generation.load();
    }

  private:
    enum class Mark : std::uint8_t
    {
        Empty,
        Refreshed,
        Invalidated,
    };

    /// Swap in a snapshot. Refreshed stamps the refresh time, Empty clears it, nullopt keeps both.
    void publish(std::shared_ptr<const Snapshot> snapshot, std::optional<Mark> mark);
    [[nodiscard]] CacheState stateLocked(Clock::time_point now) const;

    mutable std::shared_mutex m_SnapshotMutex; // Guards the fields below
    std::shared_ptr<const Snapshot> m_Snapshot;
    Mark m_Mark = Mark::Empty;
    std::optional<Clock::time_point> m_LastRefresh;
    std::chrono::milliseconds m_Ttl;

    std::mutex m_RebuildMutex; // At most one rebuild in flight, losers return false
    std::mutex m_WriterMutex;  // Serializes every snapshot swap
    std::atomic<std::uint64_t> m_Generation{0};

    mutable std::mutex m_WaitMutex;
    mutable std::condition_variable m_SnapshotChanged;
};

} // namespace Domain
