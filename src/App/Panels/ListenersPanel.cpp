#include "ListenersPanel.h"

#include "App/ListenerColumnConfig.h"
#include "App/UserConfig.h"
#include "Domain/Numeric.h"
#include "UI/Format.h"

#include <imgui.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace App
{

namespace
{

constexpr ImVec4 TEXT_ERROR{0.95F, 0.40F, 0.40F, 1.0F};
constexpr ImVec4 TEXT_SUCCESS{0.45F, 0.85F, 0.45F, 1.0F};
constexpr ImVec4 TEXT_MUTED{0.60F, 0.60F, 0.60F, 1.0F};
constexpr float ACTION_RESULT_SECONDS = 5.0F;
constexpr std::string_view SPINNER_FRAMES = "|/-\\";

[[nodiscard]] constexpr auto toImGuiId(ListenerColumn col) noexcept -> ImGuiID
{
    return ImGuiID{std::to_underlying(col)};
}

[[nodiscard]] auto columnFromUserId(ImGuiID id) -> std::optional<ListenerColumn>
{
    for (const ListenerColumn col : allListenerColumns())
    {
        if (toImGuiId(col) == id)
        {
            return col;
        }
    }
    return std::nullopt;
}

[[nodiscard]] auto spinnerFrame(float seconds) -> char
{
    constexpr float FRAMES_PER_SECOND = 8.0F;
    const auto frame = static_cast<std::size_t>(seconds * FRAMES_PER_SECOND) % SPINNER_FRAMES.size();
    return SPINNER_FRAMES[frame];
}

// ImGui column counts and ids are int
[[nodiscard]] auto imguiInt(std::size_t value) noexcept -> int
{
    return Domain::Numeric::narrowOr<int>(value, std::numeric_limits<int>::max());
}

} // namespace

ListenersPanel::ListenersPanel(Domain::SnapshotCache& cache,
                               Domain::RefreshCoordinator& coordinator,
                               Domain::QueryFacade& facade,
                               std::unique_ptr<Platform::IProcessActions> actions)
    : Panel("Listeners"),
      m_Cache(cache),
      m_Coordinator(coordinator),
      m_Facade(facade),
      m_ProcessActions(std::move(actions)),
      m_ActionCapabilities(m_ProcessActions->actionCapabilities())
{
}

ListenersPanel::~ListenersPanel()
{
    onDetach();
}

void ListenersPanel::onAttach()
{
    // Only a flag is touched on the refresh thread; the re-query runs on the UI thread.
    m_ListenerId = m_Coordinator.subscribe(
        [this](const Domain::RefreshEvent& event)
        {
            if (event.success)
            {
                m_RefreshSucceeded.store(true);
            }
        });

    const std::string& lastKeyword = UserConfig::get().settings().lastKeyword;
    const std::size_t length = std::min(lastKeyword.size(), m_SearchBuffer.size() - 1);
    std::copy_n(lastKeyword.begin(), length, m_SearchBuffer.begin());
    m_SearchBuffer[length] = '\0';

    submitQuery(std::string(m_SearchBuffer.data()));
    spdlog::info("ListenersPanel: attached (initial keyword '{}')", m_ActiveKeyword);
}

void ListenersPanel::onDetach()
{
    if (m_ListenerId != 0)
    {
        m_Coordinator.unsubscribe(m_ListenerId);
        m_ListenerId = 0;
        UserConfig::get().settings().lastKeyword = m_ActiveKeyword;
    }

    m_QueuedKeyword.reset();
    if (m_PendingQuery.valid())
    {
        // Bounded by the fallback budget plus one direct fetch
        m_PendingQuery.wait();
        m_PendingQuery = {};
    }
}

void ListenersPanel::onUpdate(float deltaTime)
{
    if (m_ActionResultTimer > 0.0F)
    {
        m_ActionResultTimer -= deltaTime;
        if (m_ActionResultTimer <= 0.0F)
        {
            m_LastActionResult.clear();
        }
    }

    if (m_PendingQuery.valid())
    {
        m_BusyTime += deltaTime;
        if (m_PendingQuery.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        {
            return;
        }

        applyResult(m_PendingQuery.get());
        m_PendingQuery = {};
        m_BusyTime = 0.0F;

        if (m_QueuedKeyword.has_value())
        {
            const std::string keyword = std::move(*m_QueuedKeyword);
            m_QueuedKeyword.reset();
            startQuery(keyword);
            return;
        }
    }

    if (m_RefreshSucceeded.exchange(false))
    {
        spdlog::debug("ListenersPanel: refresh succeeded, re-running '{}'", m_ActiveKeyword);
        startQuery(m_ActiveKeyword);
    }
}

void ListenersPanel::submitQuery(const std::string& keyword)
{
    if (m_PendingQuery.valid())
    {
        m_QueuedKeyword = keyword;
        return;
    }
    startQuery(keyword);
}

void ListenersPanel::startQuery(const std::string& keyword)
{
    m_ActiveKeyword = keyword;

    if (m_Cache.isValid())
    {
        applyResult(m_Facade.query(keyword, false));
        return;
    }

    spdlog::debug("ListenersPanel: cache not valid, querying '{}' in the background", keyword);
    m_BusyTime = 0.0F;
    m_PendingQuery = std::async(std::launch::async, [&facade = m_Facade, keyword]() { return facade.query(keyword, true); });
}

void ListenersPanel::applyResult(Domain::QueryResult result)
{
    m_Results = std::move(result.records);
    m_ResultSource = result.source;
    sortRecords(m_Results, m_SortColumn, m_SortAscending);
}

bool ListenersPanel::canSignal(const Domain::Record& record) const
{
    const auto pid = numericId(record.id);
    return m_ActionCapabilities.canTerminate && pid.has_value() &&
           !m_ProcessActions->isProtected(Domain::Numeric::narrowOr<std::int32_t>(*pid, -1));
}

void ListenersPanel::dropRecord(const Domain::Record& record)
{
    m_Cache.removeRecord(record.id);
    std::erase_if(m_Results, [&record](const Domain::Record& r) { return r.id == record.id; });
    m_Coordinator.requestRefresh();
}

void ListenersPanel::terminateRecord(const Domain::Record& record, bool force)
{
    m_ActionResultTimer = ACTION_RESULT_SECONDS;

    const auto id = numericId(record.id);
    if (!id.has_value())
    {
        m_LastActionResult = "Error: '" + record.id + "' is not a process ID";
        m_LastActionFailed = true;
        return;
    }
    const auto pid = Domain::Numeric::narrowOr<std::int32_t>(*id, -1);

    // The snapshot can be seconds old; the process may be gone already
    if (!m_ProcessActions->isRunning(pid))
    {
        spdlog::info("ListenersPanel: {} (PID {}) already exited", record.name, record.id);
        m_LastActionResult = record.name + " (PID " + record.id + ") has already exited";
        m_LastActionFailed = false;
        dropRecord(record);
        return;
    }

    const auto result = force ? m_ProcessActions->kill(pid) : m_ProcessActions->terminate(pid);
    const char* signalName = force ? "SIGKILL" : "SIGTERM";
    if (result.success)
    {
        spdlog::info("ListenersPanel: sent {} to {} (PID {})", signalName, record.name, record.id);
        m_LastActionResult = std::string("Success: ") + signalName + " sent to " + record.name + " (PID " + record.id + ")";
        m_LastActionFailed = false;
        dropRecord(record);
    }
    else
    {
        spdlog::warn("ListenersPanel: {} to PID {} failed: {}", signalName, record.id, result.errorMessage);
        m_LastActionResult = "Error: " + result.errorMessage;
        m_LastActionFailed = true;
    }
}

void ListenersPanel::render(bool* open)
{
    if (!ImGui::Begin(m_Name.c_str(), open))
    {
        ImGui::End();
        return;
    }

    renderSearchBar();

    if (!m_LastActionResult.empty())
    {
        ImGui::TextColored(m_LastActionFailed ? TEXT_ERROR : TEXT_SUCCESS, "%s", m_LastActionResult.c_str());
    }

    renderTable();
    renderCommandLineModal();
    renderTerminateModal();

    ImGui::End();
}

void ListenersPanel::renderSearchBar()
{
    ImGui::SetNextItemWidth(260.0F);
    if (ImGui::InputTextWithHint("##search",
                                 "Keyword (* wildcard), Enter to search",
                                 m_SearchBuffer.data(),
                                 m_SearchBuffer.size(),
                                 ImGuiInputTextFlags_EnterReturnsTrue))
    {
        submitQuery(std::string(m_SearchBuffer.data()));
    }

    ImGui::SameLine();
    if (ImGui::Button("Search"))
    {
        submitQuery(std::string(m_SearchBuffer.data()));
    }

    ImGui::SameLine();
    if (m_SearchBuffer[0] != '\0' && ImGui::SmallButton("X"))
    {
        m_SearchBuffer.fill('\0');
        submitQuery({});
    }

    ImGui::SameLine();
    if (m_PendingQuery.valid())
    {
        ImGui::TextColored(TEXT_MUTED, "%c Waiting for fresh data...", spinnerFrame(m_BusyTime));
    }
    else
    {
        const std::string summary = UI::Format::formatCountWithLabel(m_Results.size(), "matches");
        ImGui::TextColored(TEXT_MUTED, "%s (%s)", summary.c_str(), std::string(Domain::toString(m_ResultSource)).c_str());
    }
}

void ListenersPanel::renderTable()
{
    const int totalColumns = imguiInt(listenerColumnCount());

    if (!ImGui::BeginTable("ListenersTable",
                           totalColumns,
                           ImGuiTableFlags_Resizable | ImGuiTableFlags_Sortable | ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter |
                               ImGuiTableFlags_BordersV | ImGuiTableFlags_ScrollY | ImGuiTableFlags_Hideable |
                               ImGuiTableFlags_SizingFixedFit))
    {
        return;
    }

    ImGui::TableSetupScrollFreeze(0, 1);

    for (const ListenerColumn col : allListenerColumns())
    {
        const auto info = getColumnInfo(col);
        ImGuiTableColumnFlags flags = ImGuiTableColumnFlags_None;

        if (!info.defaultVisible)
        {
            flags |= ImGuiTableColumnFlags_DefaultHide;
        }
        if (!info.canHide)
        {
            flags |= ImGuiTableColumnFlags_NoHide;
        }
        if (!info.sortable)
        {
            flags |= ImGuiTableColumnFlags_NoSort;
        }
        if (col == ListenerColumn::PID)
        {
            flags |= ImGuiTableColumnFlags_DefaultSort;
        }

        const std::string label(info.name);
        if (info.defaultWidth > 0.0F)
        {
            ImGui::TableSetupColumn(label.c_str(), flags, info.defaultWidth, toImGuiId(col));
        }
        else
        {
            ImGui::TableSetupColumn(label.c_str(), flags | ImGuiTableColumnFlags_WidthStretch, 0.0F, toImGuiId(col));
        }
    }

    ImGui::TableHeadersRow();

    if (ImGuiTableSortSpecs* sortSpecs = ImGui::TableGetSortSpecs(); sortSpecs != nullptr && sortSpecs->SpecsDirty)
    {
        if (sortSpecs->SpecsCount > 0)
        {
            const ImGuiTableColumnSortSpecs& spec = sortSpecs->Specs[0];
            if (const auto col = columnFromUserId(spec.ColumnUserID); col.has_value())
            {
                m_SortColumn = *col;
                m_SortAscending = (spec.SortDirection == ImGuiSortDirection_Ascending);
                sortRecords(m_Results, m_SortColumn, m_SortAscending);
            }
        }
        sortSpecs->SpecsDirty = false;
    }

    // Rows may be removed by a terminate inside the loop; iterate over a copy.
    const std::vector<Domain::Record> rows = m_Results;
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        renderRow(rows[i], i);
    }

    ImGui::EndTable();
}

void ListenersPanel::renderRow(const Domain::Record& record, std::size_t rowIndex)
{
    ImGui::PushID(imguiInt(rowIndex));
    ImGui::TableNextRow();

    int colIdx = 0;
    for (const ListenerColumn col : allListenerColumns())
    {
        if (!ImGui::TableSetColumnIndex(colIdx++))
        {
            continue;
        }

        if (col == ListenerColumn::PID)
        {
            ImGui::Selectable(record.id.c_str(), false, ImGuiSelectableFlags_SpanAllColumns | ImGuiSelectableFlags_AllowOverlap);

            if (ImGui::IsItemHovered() && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left))
            {
                m_CommandLineRecord = record;
                m_OpenCommandLine = true;
            }

            if (ImGui::BeginPopupContextItem("RowContext"))
            {
                ImGui::TextColored(TEXT_MUTED, "%s (PID %s)", record.name.c_str(), record.id.c_str());
                ImGui::Separator();
                if (canSignal(record) && ImGui::MenuItem("Terminate..."))
                {
                    m_TerminateTarget = record;
                    m_ForceKill = false;
                    m_OpenTerminateConfirm = true;
                }
                if (ImGui::MenuItem("Show Command Line"))
                {
                    m_CommandLineRecord = record;
                    m_OpenCommandLine = true;
                }
                if (ImGui::BeginMenu("Copy"))
                {
                    for (const ListenerColumn copyCol : allListenerColumns())
                    {
                        if (copyCol == ListenerColumn::Action)
                        {
                            continue;
                        }
                        const std::string label(getColumnInfo(copyCol).name);
                        if (ImGui::MenuItem(label.c_str()))
                        {
                            ImGui::SetClipboardText(cellText(record, copyCol).c_str());
                        }
                    }
                    ImGui::EndMenu();
                }
                ImGui::EndPopup();
            }
            continue;
        }

        if (col == ListenerColumn::Action)
        {
            const bool allowed = canSignal(record);
            ImGui::BeginDisabled(!allowed);
            if (ImGui::SmallButton("Terminate"))
            {
                m_TerminateTarget = record;
                m_ForceKill = false;
                m_OpenTerminateConfirm = true;
            }
            ImGui::EndDisabled();
            if (!allowed && ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled))
            {
                ImGui::SetTooltip("This process cannot be signalled from here");
            }
            continue;
        }

        const std::string text = cellText(record, col);
        ImGui::TextUnformatted(text.c_str());
        if (col == ListenerColumn::Ports && ImGui::IsItemHovered() && record.ports.size() > 1)
        {
            ImGui::SetTooltip("%zu listening ports", record.ports.size());
        }
    }

    ImGui::PopID();
}

void ListenersPanel::renderCommandLineModal()
{
    if (m_OpenCommandLine)
    {
        ImGui::OpenPopup("Command Line");
        m_OpenCommandLine = false;
    }

    ImGui::SetNextWindowSize(ImVec2(560.0F, 0.0F), ImGuiCond_Appearing);
    if (!ImGui::BeginPopupModal("Command Line", nullptr))
    {
        return;
    }

    if (m_CommandLineRecord.has_value())
    {
        const auto& record = *m_CommandLineRecord;
        ImGui::TextColored(TEXT_MUTED, "%s (PID %s, %s)", record.name.c_str(), record.id.c_str(), record.owner.c_str());
        ImGui::Separator();
        ImGui::PushTextWrapPos(0.0F);
        ImGui::TextUnformatted(record.detail.c_str());
        ImGui::PopTextWrapPos();
        ImGui::Spacing();

        if (ImGui::Button("Copy", ImVec2(120, 0)))
        {
            ImGui::SetClipboardText(record.detail.c_str());
        }
        ImGui::SameLine();
    }

    if (ImGui::Button("Close", ImVec2(120, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape))
    {
        m_CommandLineRecord.reset();
        ImGui::CloseCurrentPopup();
    }

    ImGui::EndPopup();
}

void ListenersPanel::renderTerminateModal()
{
    if (m_OpenTerminateConfirm)
    {
        ImGui::OpenPopup("Confirm Terminate");
        m_OpenTerminateConfirm = false;
    }

    if (!ImGui::BeginPopupModal("Confirm Terminate", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        return;
    }

    if (m_TerminateTarget.has_value())
    {
        ImGui::Text("Send %s to '%s' (PID %s)?",
                    m_ForceKill ? "SIGKILL" : "SIGTERM",
                    m_TerminateTarget->name.c_str(),
                    m_TerminateTarget->id.c_str());
        if (!m_TerminateTarget->ports.empty())
        {
            const std::string ports = UI::Format::formatPorts(m_TerminateTarget->ports);
            ImGui::TextColored(TEXT_MUTED, "Listening on: %s", ports.c_str());
        }
        if (m_ActionCapabilities.canKill)
        {
            ImGui::Checkbox("Force (process cannot clean up)", &m_ForceKill);
        }
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();
    }

    if (ImGui::Button("Yes", ImVec2(120, 0)))
    {
        if (m_TerminateTarget.has_value())
        {
            terminateRecord(*m_TerminateTarget, m_ForceKill);
        }
        m_TerminateTarget.reset();
        ImGui::CloseCurrentPopup();
    }

    ImGui::SameLine();

    if (ImGui::Button("No", ImVec2(120, 0)))
    {
        m_TerminateTarget.reset();
        ImGui::CloseCurrentPopup();
    }

    ImGui::EndPopup();
}

} // namespace App
