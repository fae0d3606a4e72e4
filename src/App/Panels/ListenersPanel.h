#pragma once

#include "App/ListenerColumnConfig.h"
#include "App/Panel.h"
#include "Domain/QueryFacade.h"
#include "Domain/RefreshCoordinator.h"
#include "Domain/SnapshotCache.h"
#include "Platform/IProcessActions.h"

#include <array>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace App
{

/// Panel with the keyword search box and the table of matching listening processes.
/// Queries run synchronously while the cache is valid and on a worker thread otherwise.
class ListenersPanel : public Panel
{
  public:
    ListenersPanel(Domain::SnapshotCache& cache,
                   Domain::RefreshCoordinator& coordinator,
                   Domain::QueryFacade& facade,
                   std::unique_ptr<Platform::IProcessActions> actions);
    ~ListenersPanel() override;

    ListenersPanel(const ListenersPanel&) = delete;
    ListenersPanel& operator=(const ListenersPanel&) = delete;
    ListenersPanel(ListenersPanel&&) = delete;
    ListenersPanel& operator=(ListenersPanel&&) = delete;

    /// Subscribe to refresh notifications and run the initial query.
    void onAttach() override;

    /// Unsubscribe and wait out any query still in flight.
    void onDetach() override;

    /// Collect finished queries and re-query after successful refreshes.
    void onUpdate(float deltaTime) override;

    void render(bool* open) override;

    /// Run a query for the given keyword (queued if one is already running).
    void submitQuery(const std::string& keyword);

    [[nodiscard]] const std::string& activeKeyword() const
    {
        return m_ActiveKeyword;
    }

    [[nodiscard]] bool isQueryPending() const
    {
        return m_PendingQuery.valid();
    }

  private:
    void startQuery(const std::string& keyword);
    void applyResult(Domain::QueryResult result);
    [[nodiscard]] bool canSignal(const Domain::Record& record) const;
    void terminateRecord(const Domain::Record& record, bool force);
    void dropRecord(const Domain::Record& record);

    void renderSearchBar();
    void renderTable();
    void renderRow(const Domain::Record& record, std::size_t rowIndex);
    void renderCommandLineModal();
    void renderTerminateModal();

    Domain::SnapshotCache& m_Cache;
    Domain::RefreshCoordinator& m_Coordinator;
    Domain::QueryFacade& m_Facade;
    std::unique_ptr<Platform::IProcessActions> m_ProcessActions;
    Platform::ProcessActionCapabilities m_ActionCapabilities;

    Domain::RefreshCoordinator::ListenerId m_ListenerId = 0;
    std::atomic<bool> m_RefreshSucceeded{false};

    // Search state
    std::array<char, 256> m_SearchBuffer{};
    std::string m_ActiveKeyword;
    std::future<Domain::QueryResult> m_PendingQuery;
    std::optional<std::string> m_QueuedKeyword;
    float m_BusyTime = 0.0F;

    // Results
    std::vector<Domain::Record> m_Results;
    Domain::QuerySource m_ResultSource = Domain::QuerySource::Cache;
    ListenerColumn m_SortColumn = ListenerColumn::PID;
    bool m_SortAscending = true;

    // Dialog state
    std::optional<Domain::Record> m_CommandLineRecord;
    bool m_OpenCommandLine = false;
    std::optional<Domain::Record> m_TerminateTarget;
    bool m_OpenTerminateConfirm = false;
    bool m_ForceKill = false;
    std::string m_LastActionResult;
    bool m_LastActionFailed = false;
    float m_ActionResultTimer = 0.0F;
};

} // namespace App
