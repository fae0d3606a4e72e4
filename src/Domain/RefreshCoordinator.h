#pragma once

#include "Domain/IRecordSource.h"
#include "Domain/SnapshotCache.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Domain
{

/// Result of a single fetch-then-rebuild.
struct RefreshOutcome
{
    bool success = false;
    std::string errorMessage;
    std::size_t recordCount = 0;
};

/// Delivered to subscribers after every refresh attempt.
struct RefreshEvent
{
    bool success = false;
    std::string errorMessage;    // Set on failure
    std::vector<Record> records; // Set on success
};

/// Drives periodic refresh of a SnapshotCache from a record source on a background thread.
/// Refreshes are single-flight: a forced refresh that overlaps an in-flight one shares its outcome.
class RefreshCoordinator
{
  public:
    using Listener = std::function<void(const RefreshEvent&)>;
    using ListenerId = std::uint64_t;

    RefreshCoordinator(std::shared_ptr<IRecordSource> source, SnapshotCache& cache, std::chrono::milliseconds period);
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;
    RefreshCoordinator(RefreshCoordinator&&) = delete;
    RefreshCoordinator& operator=(RefreshCoordinator&&) = delete;

    /// Start the refresh thread. The first refresh runs immediately.
    void start();

    /// Stop the refresh thread. An in-flight refresh completes first; no tick fires afterwards.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Fetch and rebuild now, on the calling thread.
    RefreshOutcome forceRefresh();

    /// Wake the refresh thread for an early refresh.
    void requestRefresh();

    [[nodiscard]] std::chrono::milliseconds period() const;

    /// Takes effect on the next wait.
    void setPeriod(std::chrono::milliseconds period);

    /// Listeners run on whichever thread performs the refresh.
    ListenerId subscribe(Listener listener);

    /// After return the listener is never invoked again. A call already running on
    /// another thread finishes before this returns.
    void unsubscribe(ListenerId id);

    /// Successful refreshes since construction.
    [[nodiscard]] std::uint64_t refreshCount() const noexcept
    {
        return m_RefreshCount.load();
    }

    [[nodiscard]] std::uint64_t failureCount() const noexcept
    {
        return m_FailureCount.load();
    }

    /// Error of the most recent failed refresh, cleared by the next success.
    [[nodiscard]] std::string lastError() const;

  private:
    void refreshLoop(std::stop_token stopToken);
    [[nodiscard]] RefreshOutcome performRefresh();
    void notify(const RefreshEvent& event);

    std::shared_ptr<IRecordSource> m_Source;
    SnapshotCache& m_Cache;

    std::jthread m_RefreshThread;
    std::atomic<bool> m_Running{false};

    mutable std::mutex m_WakeMutex; // Guards period and wake flag
    std::condition_variable_any m_WakeCondition;
    std::chrono::milliseconds m_Period;
    bool m_RefreshRequested = false;

    mutable std::mutex m_FlightMutex; // Guards single-flight state
    std::condition_variable m_FlightDone;
    bool m_InFlight = false;
    std::uint64_t m_CompletedFlights = 0;
    RefreshOutcome m_LastOutcome;

    mutable std::mutex m_ListenerMutex;
    std::condition_variable m_ListenerIdle;
    std::vector<std::pair<ListenerId, Listener>> m_Listeners;
    ListenerId m_NextListenerId = 1;
    ListenerId m_RunningListener = 0; // 0 while no callback runs
    std::thread::id m_NotifyingThread;

    std::atomic<std::uint64_t> m_RefreshCount{0};
    std::atomic<std::uint64_t> m_FailureCount{0};
};

} // namespace Domain
