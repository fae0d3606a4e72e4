#include "App/ShellLayer.h"
#include "App/UserConfig.h"
#include "Core/Application.h"
#include "Platform/Factory.h"
#include "UI/UILayer.h"
#include "version.h"

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <vector>

namespace
{

/// Console plus a per-run log file in the user state directory.
/// File logging is optional; the console sink is always installed.
void setupLogging()
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::filesystem::path logPath;
    try
    {
        const auto stateDir = Platform::makePathProvider()->getUserStateDir();
        std::filesystem::create_directories(stateDir);
        logPath = stateDir / "portscope.log";
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true));
    }
    catch (const spdlog::spdlog_ex& e)
    {
        spdlog::warn("Failed to open log file {}: {}", logPath.string(), e.what());
        logPath.clear();
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        spdlog::warn("Failed to create log directory: {}", e.what());
        logPath.clear();
    }

    auto logger = std::make_shared<spdlog::logger>("PortScope", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

#ifndef NDEBUG
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_on(spdlog::level::debug);
#else
    spdlog::flush_on(spdlog::level::warn);
#endif

    if (!logPath.empty())
    {
        spdlog::info("Log file: {}", logPath.string());
    }
}

auto runApp() -> int
{
    setupLogging();

    spdlog::info("{} v{} ({} build)", portscope::Version::PROJECT_NAME, portscope::Version::STRING, portscope::Version::BUILD_TYPE);
    spdlog::debug("Compiler: {} {}", portscope::Version::COMPILER_ID, portscope::Version::COMPILER_VERSION);
    spdlog::debug("Built: {} {}", portscope::Version::BUILD_DATE, portscope::Version::BUILD_TIME);

    // Load user configuration early so we can apply window geometry before creating the GLFW window.
    auto& userConfig = App::UserConfig::get();
    userConfig.load();
    const auto& settings = userConfig.settings();

    Core::ApplicationSpecification appSpec;
    appSpec.Name = "PortScope";
    appSpec.Width = static_cast<std::uint32_t>(std::clamp(settings.windowWidth, 200, 16'384));
    appSpec.Height = static_cast<std::uint32_t>(std::clamp(settings.windowHeight, 200, 16'384));
    appSpec.VSync = true;

    Core::Application app(appSpec);

    // Ordering: set restore geometry first, then maximize.
    if (settings.windowPosX.has_value() && settings.windowPosY.has_value())
    {
        app.getWindow().setPosition(*settings.windowPosX, *settings.windowPosY);
    }
    if (settings.windowMaximized)
    {
        app.getWindow().maximize();
    }

    // UI layer first: it opens and closes the ImGui frame around the shell
    app.pushLayer<UI::UILayer>();
    app.pushLayer<App::ShellLayer>();

    app.run();

    return EXIT_SUCCESS;
}

} // namespace

auto main() -> int
{
    try
    {
        return runApp();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Fatal: {}", e.what());
        return EXIT_FAILURE;
    }
}
