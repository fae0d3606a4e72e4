#pragma once

#include "Layer.h"
#include "Window.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace Core
{

struct ApplicationSpecification
{
    std::string Name = "Application";
    uint32_t Width = 1280;
    uint32_t Height = 720;
    bool VSync = true;
    // Upper bound on how long the loop blocks waiting for input while no layer is busy
    double IdleWaitSeconds = 0.25;
};

class Application
{
  public:
    explicit Application(ApplicationSpecification spec = ApplicationSpecification());
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    void run();
    void stop();

    template<typename T, typename... Args>
        requires std::is_base_of_v<Layer, T>
    void pushLayer(Args&&... args)
    {
        auto& layer = m_LayerStack.emplace_back(std::make_unique<T>(std::forward<Args>(args)...));
        layer->onAttach();
        onLayerPushed(*layer);
    }

    [[nodiscard]] Window& getWindow() const
    {
        return *m_Window;
    }

    [[nodiscard]] std::size_t layerCount() const
    {
        return m_LayerStack.size();
    }

    /// Throws std::logic_error when no application exists.
    [[nodiscard]] static Application& get();
    [[nodiscard]] static float getTime();

  private:
    void onLayerPushed(const Layer& layer) const;
    void waitForEvents() const;

    ApplicationSpecification m_Spec;
    std::unique_ptr<Window> m_Window;
    std::vector<std::unique_ptr<Layer>> m_LayerStack;
    bool m_Running = false;

    static Application* s_Instance;
};

} // namespace Core
