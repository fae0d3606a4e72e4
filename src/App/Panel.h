#pragma once

#include <string>
#include <utility>

namespace App
{

/// An ImGui window hosted by ShellLayer, which forwards attach/detach/update
/// and owns the visibility flag.
class Panel
{
  public:
    explicit Panel(std::string name) : m_Name(std::move(name))
    {
    }

    virtual ~Panel() = default;

    Panel(const Panel&) = delete;
    Panel& operator=(const Panel&) = delete;
    Panel(Panel&&) = delete;
    Panel& operator=(Panel&&) = delete;

    virtual void onAttach() = 0;
    virtual void onDetach() = 0;
    virtual void onUpdate(float deltaTime) = 0;

    /// Draw between ImGui::Begin/End titled name(). The window's close button clears *open.
    virtual void render(bool* open) = 0;

    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_Name;
    }

  protected:
    std::string m_Name;
};

} // namespace App
