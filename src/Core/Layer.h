#pragma once

#include <string>
#include <utility>

namespace Core
{

/// One slice of the frame. Layers are updated, rendered and post-rendered in push order
/// and detached in reverse order when the application shuts down.
class Layer
{
  public:
    explicit Layer(std::string name = "Layer") : m_Name(std::move(name))
    {
    }

    virtual ~Layer() = default;

    Layer(const Layer&) = default;
    Layer& operator=(const Layer&) = default;
    Layer(Layer&&) = default;
    Layer& operator=(Layer&&) = default;

    virtual void onAttach()
    {
    }
    virtual void onDetach()
    {
    }
    virtual void onUpdate([[maybe_unused]] float deltaTime)
    {
    }
    virtual void onRender()
    {
    }
    virtual void onPostRender()
    {
    }

    /// True while the layer has work whose progress should be redrawn every frame.
    /// When no layer is busy the main loop sleeps until input arrives or the idle timeout passes.
    [[nodiscard]] virtual bool isBusy() const
    {
        return false;
    }

    [[nodiscard]] const std::string& getName() const
    {
        return m_Name;
    }

  protected:
    std::string m_Name;
};

} // namespace Core
