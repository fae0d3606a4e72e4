#include "RefreshCoordinator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace Domain
{

RefreshCoordinator::RefreshCoordinator(std::shared_ptr<IRecordSource> source, SnapshotCache& cache, std::chrono::milliseconds period)
    : m_Source(std::move(source)), m_Cache(cache), m_Period(period)
{
    spdlog::debug("RefreshCoordinator: created with {}ms period", m_Period.count());
}

RefreshCoordinator::~RefreshCoordinator()
{
    stop();
}

void RefreshCoordinator::start()
{
    if (m_Running.load())
    {
        spdlog::warn("RefreshCoordinator: already running");
        return;
    }

    // A previous stop() issued from the refresh thread itself leaves it to be joined here
    if (m_RefreshThread.joinable())
    {
        m_RefreshThread.join();
    }

    spdlog::info("RefreshCoordinator: starting with {}ms period", period().count());
    m_Running.store(true);
    m_RefreshThread = std::jthread([this](std::stop_token st) { refreshLoop(st); });
}

void RefreshCoordinator::stop()
{
    const bool wasRunning = m_Running.exchange(false);

    if (m_RefreshThread.joinable())
    {
        m_RefreshThread.request_stop();

        // A listener may call stop() from the refresh thread; it cannot join itself
        if (m_RefreshThread.get_id() != std::this_thread::get_id())
        {
            m_RefreshThread.join();
        }
    }

    if (wasRunning)
    {
        spdlog::info("RefreshCoordinator: stopped");
    }
}

bool RefreshCoordinator::isRunning() const
{
    return m_Running.load();
}

RefreshOutcome RefreshCoordinator::forceRefresh()
{
    std::unique_lock lock(m_FlightMutex);
    if (m_InFlight)
    {
        const std::uint64_t awaited = m_CompletedFlights;
        m_FlightDone.wait(lock, [this, awaited] { return m_CompletedFlights != awaited; });
        spdlog::debug("RefreshCoordinator: joined in-flight refresh");
        return m_LastOutcome;
    }

    m_InFlight = true;
    lock.unlock();

    RefreshOutcome outcome = performRefresh();

    lock.lock();
    m_InFlight = false;
    ++m_CompletedFlights;
    m_LastOutcome = outcome;
    lock.unlock();
    m_FlightDone.notify_all();

    return outcome;
}

void RefreshCoordinator::requestRefresh()
{
    {
        std::lock_guard lock(m_WakeMutex);
        m_RefreshRequested = true;
    }
    m_WakeCondition.notify_all();
}

std::chrono::milliseconds RefreshCoordinator::period() const
{
    std::lock_guard lock(m_WakeMutex);
    return m_Period;
}

void RefreshCoordinator::setPeriod(std::chrono::milliseconds newPeriod)
{
    {
        std::lock_guard lock(m_WakeMutex);
        m_Period = newPeriod;
    }
    spdlog::info("RefreshCoordinator: period changed to {}ms", newPeriod.count());
}

RefreshCoordinator::ListenerId RefreshCoordinator::subscribe(Listener listener)
{
    std::lock_guard lock(m_ListenerMutex);
    const ListenerId id = m_NextListenerId++;
    m_Listeners.emplace_back(id, std::move(listener));
    return id;
}

void RefreshCoordinator::unsubscribe(ListenerId id)
{
    std::unique_lock lock(m_ListenerMutex);
    std::erase_if(m_Listeners, [id](const auto& entry) { return entry.first == id; });

    // A listener unsubscribing itself from inside its callback must not wait on itself
    if (m_NotifyingThread != std::this_thread::get_id())
    {
        m_ListenerIdle.wait(lock, [this, id] { return m_RunningListener != id; });
    }
}

std::string RefreshCoordinator::lastError() const
{
    std::lock_guard lock(m_FlightMutex);
    return m_LastOutcome.success ? std::string{} : m_LastOutcome.errorMessage;
}

RefreshOutcome RefreshCoordinator::performRefresh()
{
    const auto startTime = std::chrono::steady_clock::now();
    spdlog::debug("RefreshCoordinator: refresh started");

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
        ++m_FailureCount;
        spdlog::warn("RefreshCoordinator: refresh failed, keeping previous snapshot: {}", fetched.errorMessage);
        notify(RefreshEvent{.success = false, .errorMessage = fetched.errorMessage, .records = {}});
        return RefreshOutcome{.success = false, .errorMessage = std::move(fetched.errorMessage), .recordCount = 0};
    }

    const std::size_t count = fetched.records.size();
    if (!m_Cache.rebuild(fetched.records))
    {
        // Lost to a rebuild issued directly on the cache
        std::string error = "cache rebuild already in progress";
        ++m_FailureCount;
        spdlog::warn("RefreshCoordinator: fetched {} records but {}", count, error);
        notify(RefreshEvent{.success = false, .errorMessage = error, .records = {}});
        return RefreshOutcome{.success = false, .errorMessage = std::move(error), .recordCount = 0};
    }

    ++m_RefreshCount;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    spdlog::debug("RefreshCoordinator: refresh finished with {} records in {}ms", count, elapsed.count());

    notify(RefreshEvent{.success = true, .errorMessage = {}, .records = std::move(fetched.records)});
    return RefreshOutcome{.success = true, .errorMessage = {}, .recordCount = count};
}

void RefreshCoordinator::notify(const RefreshEvent& event)
{
    std::vector<std::pair<ListenerId, Listener>> listeners;
    {
        std::lock_guard lock(m_ListenerMutex);
        listeners = m_Listeners;
        m_NotifyingThread = std::this_thread::get_id();
    }

    for (const auto& entry : listeners)
    {
        const ListenerId id = entry.first;
        {
            std::lock_guard lock(m_ListenerMutex);
            if (std::ranges::none_of(m_Listeners, [id](const auto& current) { return current.first == id; }))
            {
                continue; // Unsubscribed by an earlier listener in this round
            }
            m_RunningListener = id;
        }

        try
        {
            entry.second(event);
        }
        catch (const std::exception& e)
        {
            spdlog::error("RefreshCoordinator: listener {} threw: {}", id, e.what());
        }

        {
            std::lock_guard lock(m_ListenerMutex);
            m_RunningListener = 0;
        }
        m_ListenerIdle.notify_all();
    }

    std::lock_guard lock(m_ListenerMutex);
    m_NotifyingThread = std::thread::id{};
}

void RefreshCoordinator::refreshLoop(std::stop_token stopToken)
{
    spdlog::debug("RefreshCoordinator: thread started");

    while (!stopToken.stop_requested())
    {
        {
            std::lock_guard lock(m_WakeMutex);
            m_RefreshRequested = false;
        }

        static_cast<void>(forceRefresh());

        std::unique_lock lock(m_WakeMutex);

        // Returns early on stop or an explicit refresh request; otherwise sleeps one period
        const auto deadline = std::chrono::steady_clock::now() + m_Period;
        m_WakeCondition.wait_until(lock, stopToken, deadline, [this] { return m_RefreshRequested; });
    }

    spdlog::debug("RefreshCoordinator: thread exiting");
}

} // namespace Domain
