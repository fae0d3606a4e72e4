#include "ShellLayer.h"

#include "App/UserConfig.h"
#include "Core/Application.h"
#include "Core/Layer.h"
#include "Domain/CacheConfig.h"
#include "Domain/ProbeRecordSource.h"
#include "Platform/Factory.h"
#include "UI/Format.h"

#include <imgui.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

namespace App
{

namespace
{

constexpr ImVec4 STATE_VALID{0.45F, 0.85F, 0.45F, 1.0F};
constexpr ImVec4 STATE_STALE{0.95F, 0.75F, 0.30F, 1.0F};
constexpr ImVec4 STATE_INVALID{0.95F, 0.40F, 0.40F, 1.0F};
constexpr ImVec4 STATE_EMPTY{0.60F, 0.60F, 0.60F, 1.0F};

[[nodiscard]] ImVec4 stateColor(Domain::CacheState state)
{
    switch (state)
    {
    case Domain::CacheState::Valid:
        return STATE_VALID;
    case Domain::CacheState::Stale:
        return STATE_STALE;
    case Domain::CacheState::Invalid:
        return STATE_INVALID;
    case Domain::CacheState::Empty:
        break;
    }
    return STATE_EMPTY;
}

[[nodiscard]] float statusBarHeight()
{
    return ImGui::GetFrameHeight() + (ImGui::GetStyle().WindowPadding.y * 2.0F);
}

/// Open a file with the desktop's default application
void openFileWithDefaultEditor(const std::filesystem::path& filePath)
{
    if (!std::filesystem::exists(filePath))
    {
        spdlog::error("ShellLayer: cannot open {}: file does not exist", filePath.string());
        return;
    }

    // Double-fork so xdg-open is adopted by init and never left as a zombie
    const pid_t pid = fork();
    if (pid == -1)
    {
        spdlog::error("ShellLayer: failed to fork for xdg-open: {}", strerror(errno));
        return;
    }

    if (pid == 0)
    {
        const pid_t grandchild = fork();
        if (grandchild == -1)
        {
            _exit(EXIT_FAILURE);
        }
        if (grandchild == 0)
        {
            const std::string pathStr = filePath.string();
            execlp("xdg-open", "xdg-open", pathStr.c_str(), nullptr);
            _exit(EXIT_FAILURE);
        }
        _exit(0);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) == -1)
    {
        spdlog::error("ShellLayer: waitpid failed for xdg-open child: {}", strerror(errno));
        return;
    }
    spdlog::info("ShellLayer: opened config file with xdg-open: {}", filePath.string());
}

} // namespace

ShellLayer::ShellLayer() : Layer("ShellLayer")
{
}

ShellLayer::~ShellLayer()
{
    // Panel must let go of the coordinator before it is stopped and destroyed
    m_ListenersPanel.reset();
    if (m_Coordinator)
    {
        m_Coordinator->stop();
    }
}

void ShellLayer::onAttach()
{
    auto& config = UserConfig::get();
    config.load();
    const Domain::CacheConfig cacheConfig = config.settings().cacheConfig();

    auto source = std::make_shared<Domain::ProbeRecordSource>(Platform::makeProcessProbe());
    if (!source->capabilities().hasListeningPorts)
    {
        spdlog::warn("ShellLayer: listening port enumeration unavailable; records will have no ports");
    }
    m_Source = source;

    m_Cache = std::make_unique<Domain::SnapshotCache>(cacheConfig.ttl);
    m_Coordinator = std::make_unique<Domain::RefreshCoordinator>(m_Source, *m_Cache, cacheConfig.refreshPeriod);
    m_Facade = std::make_unique<Domain::QueryFacade>(*m_Cache, *m_Coordinator, m_Source, cacheConfig);
    m_ListenersPanel = std::make_unique<ListenersPanel>(*m_Cache, *m_Coordinator, *m_Facade, Platform::makeProcessActions());

    m_Coordinator->start();
    m_ListenersPanel->onAttach();

    spdlog::info("ShellLayer: attached (ttl {} ms, refresh every {} ms)", cacheConfig.ttl.count(), cacheConfig.refreshPeriod.count());
}

void ShellLayer::onDetach()
{
    if (m_ListenersPanel)
    {
        m_ListenersPanel->onDetach();
    }
    if (m_Coordinator)
    {
        m_Coordinator->stop();
    }

    auto& settings = UserConfig::get().settings();
    auto& window = Core::Application::get().getWindow();

    settings.windowMaximized = window.isMaximized();
    if (!settings.windowMaximized)
    {
        const auto [width, height] = window.getSize();
        settings.windowWidth = width;
        settings.windowHeight = height;

        const auto [x, y] = window.getPosition();
        settings.windowPosX = x;
        settings.windowPosY = y;
    }

    UserConfig::get().save();
    spdlog::info("ShellLayer: detached");
}

void ShellLayer::onUpdate(float deltaTime)
{
    if (m_ListenersPanel)
    {
        m_ListenersPanel->onUpdate(deltaTime);
    }
}

bool ShellLayer::isBusy() const
{
    return m_ListenersPanel && m_ListenersPanel->isQueryPending();
}

void ShellLayer::onRender()
{
    if (ImGui::IsKeyPressed(ImGuiKey_F5, false) && m_Coordinator)
    {
        m_Coordinator->requestRefresh();
    }

    renderMenuBar();
    setupWorkspace();

    if (m_ShowListeners && m_ListenersPanel)
    {
        m_ListenersPanel->render(&m_ShowListeners);
    }

    renderStatusBar();
}

void ShellLayer::setupWorkspace()
{
    // Fill the area between the menu bar and the status bar with the listeners window
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos, ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, viewport->WorkSize.y - statusBarHeight()), ImGuiCond_Always);
}

void ShellLayer::renderMenuBar()
{
    if (!ImGui::BeginMainMenuBar())
    {
        return;
    }

    if (ImGui::BeginMenu("File"))
    {
        if (ImGui::MenuItem("Open Config File..."))
        {
            UserConfig::get().save();
            openFileWithDefaultEditor(UserConfig::get().configPath());
        }
        ImGui::Separator();
        if (ImGui::MenuItem("Exit", "Alt+F4"))
        {
            Core::Application::get().stop();
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("View"))
    {
        if (ImGui::MenuItem("Refresh Now", "F5") && m_Coordinator)
        {
            m_Coordinator->requestRefresh();
        }
        ImGui::MenuItem("Listeners", nullptr, &m_ShowListeners);
        ImGui::Separator();
        renderCacheSettingsMenu();
        ImGui::EndMenu();
    }

    ImGui::EndMainMenuBar();
}

void ShellLayer::renderCacheSettingsMenu()
{
    if (!ImGui::BeginMenu("Cache Settings"))
    {
        return;
    }

    auto& settings = UserConfig::get().settings();
    bool changed = false;

    ImGui::SetNextItemWidth(220.0F);
    changed |= ImGui::SliderInt("TTL (s)", &settings.ttlSeconds, Domain::Caching::TTL_SECONDS_MIN, 120);
    ImGui::SetNextItemWidth(220.0F);
    changed |= ImGui::SliderInt("Refresh (s)", &settings.refreshSeconds, Domain::Caching::REFRESH_SECONDS_MIN, 120);
    ImGui::SetNextItemWidth(220.0F);
    changed |= ImGui::SliderInt(
        "Fallback wait (ms)", &settings.fallbackWaitMs, Domain::Caching::FALLBACK_WAIT_MS_MIN, Domain::Caching::FALLBACK_WAIT_MS_MAX);
    ImGui::SetNextItemWidth(220.0F);
    changed |= ImGui::SliderInt(
        "Poll interval (ms)", &settings.pollIntervalMs, Domain::Caching::POLL_INTERVAL_MS_MIN, Domain::Caching::POLL_INTERVAL_MS_MAX);

    if (changed)
    {
        applyCacheSettings();
    }

    ImGui::Separator();
    if (ImGui::MenuItem("Reset to Defaults"))
    {
        settings.setCacheConfig(Domain::CacheConfig{});
        applyCacheSettings();
    }

    ImGui::EndMenu();
}

void ShellLayer::applyCacheSettings()
{
    if (!m_Cache || !m_Coordinator || !m_Facade)
    {
        return;
    }

    const Domain::CacheConfig config = UserConfig::get().settings().cacheConfig();
    m_Cache->setTtl(config.ttl);
    m_Coordinator->setPeriod(config.refreshPeriod);
    m_Facade->setConfig(config);
}

void ShellLayer::renderStatusBar() const
{
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    const float height = statusBarHeight();

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->WorkPos.y + viewport->WorkSize.y - height));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, height));

    const ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoScrollWithMouse |
                                         ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoNav;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0F);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 1.0F);

    if (ImGui::Begin("##StatusBar", nullptr, windowFlags) && m_Cache && m_Coordinator)
    {
        const Domain::CacheState state = m_Cache->state();
        ImGui::TextColored(stateColor(state), "%s", std::string(Domain::toString(state)).c_str());

        ImGui::SameLine();
        const std::string count = UI::Format::formatCountWithLabel(m_Cache->recordCount(), "records");
        ImGui::Text("| %s", count.c_str());

        ImGui::SameLine();
        if (m_Cache->lastRefreshTime().has_value())
        {
            const std::string age = UI::Format::formatAge(m_Cache->age());
            ImGui::Text("| age %s", age.c_str());
        }
        else
        {
            ImGui::TextUnformatted("| never refreshed");
        }

        ImGui::SameLine();
        ImGui::Text("| %llu refreshes, %llu failures",
                    static_cast<unsigned long long>(m_Coordinator->refreshCount()),
                    static_cast<unsigned long long>(m_Coordinator->failureCount()));

        const std::string lastError = m_Coordinator->lastError();
        if (!lastError.empty())
        {
            ImGui::SameLine();
            ImGui::TextColored(STATE_INVALID, "| last error: %s", lastError.c_str());
        }
    }
    ImGui::End();
    ImGui::PopStyleVar(2);
}

} // namespace App
