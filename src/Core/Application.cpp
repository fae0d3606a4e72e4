#include "Application.h"

#include "Core/Window.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <utility>

// clang-format off
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
// clang-format on

namespace Core
{

Application* Application::s_Instance = nullptr;

namespace
{
void glfwErrorCallback(int error, const char* description)
{
    spdlog::error("Application: GLFW error {}: {}", error, description);
}
} // namespace

Application::Application(ApplicationSpecification spec) : m_Spec(std::move(spec))
{
    if (s_Instance != nullptr)
    {
        throw std::logic_error("Application already exists");
    }

    spdlog::info("Application: initializing {}", m_Spec.Name);

    glfwSetErrorCallback(glfwErrorCallback);

    if (glfwInit() == GLFW_FALSE)
    {
        spdlog::critical("Application: failed to initialize GLFW");
        throw std::runtime_error("Failed to initialize GLFW");
    }

    WindowSpecification windowSpec;
    windowSpec.Title = m_Spec.Name;
    windowSpec.Width = static_cast<int>(m_Spec.Width);
    windowSpec.Height = static_cast<int>(m_Spec.Height);
    windowSpec.VSync = m_Spec.VSync;

    try
    {
        m_Window = std::make_unique<Window>(windowSpec);
    }
    catch (const std::exception&)
    {
        glfwTerminate();
        throw;
    }

    s_Instance = this;
}

Application::~Application()
{
    for (auto& layer : std::views::reverse(m_LayerStack))
    {
        layer->onDetach();
    }
    m_LayerStack.clear();
    m_Window.reset();

    glfwTerminate();

    s_Instance = nullptr;
}

void Application::onLayerPushed(const Layer& layer) const
{
    spdlog::debug("Application: attached layer {} ({} total)", layer.getName(), m_LayerStack.size());
}

void Application::waitForEvents() const
{
    const bool anyBusy = std::ranges::any_of(m_LayerStack, [](const auto& layer) { return layer->isBusy(); });

    // Minimized windows only need to wake for input; busy layers need every frame
    if (anyBusy && !m_Window->isIconified())
    {
        glfwPollEvents();
    }
    else
    {
        glfwWaitEventsTimeout(m_Spec.IdleWaitSeconds);
    }
}

void Application::run()
{
    m_Running = true;

    float lastTime = getTime();

    spdlog::info("Application: entering main loop");

    while (m_Running)
    {
        waitForEvents();

        if (m_Window->shouldClose())
        {
            stop();
            break;
        }

        const float currentTime = getTime();
        float deltaTime = currentTime - lastTime;
        lastTime = currentTime;

        // Idle waits can be long; keep per-frame timers from jumping
        constexpr float MAX_DELTA_TIME = 0.5F;
        deltaTime = std::min(deltaTime, MAX_DELTA_TIME);

        for (const auto& layer : m_LayerStack)
        {
            layer->onUpdate(deltaTime);
        }

        if (m_Window->isIconified())
        {
            continue;
        }

        for (const auto& layer : m_LayerStack)
        {
            layer->onRender();
        }

        for (const auto& layer : m_LayerStack)
        {
            layer->onPostRender();
        }

        m_Window->swapBuffers();
    }

    spdlog::info("Application: exiting main loop");
}

void Application::stop()
{
    m_Running = false;
}

Application& Application::get()
{
    if (s_Instance == nullptr)
    {
        throw std::logic_error("Application does not exist");
    }
    return *s_Instance;
}

float Application::getTime()
{
    return static_cast<float>(glfwGetTime());
}

} // namespace Core
