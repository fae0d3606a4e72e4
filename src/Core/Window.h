#pragma once

#include <string>
#include <utility>

struct GLFWwindow;

namespace Core
{

struct WindowSpecification
{
    std::string Title = "Window";
    int Width = 1280;
    int Height = 720;
    bool VSync = true;
};

/// Owns the GLFW window and its GL context. Geometry is read back from GLFW
/// so it can be persisted on shutdown.
class Window
{
  public:
    explicit Window(const WindowSpecification& spec = WindowSpecification());
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    void swapBuffers() const;
    [[nodiscard]] bool shouldClose() const;

    [[nodiscard]] GLFWwindow* getHandle() const
    {
        return m_Handle;
    }

    void setPosition(int x, int y) const;
    [[nodiscard]] auto getPosition() const -> std::pair<int, int>;
    [[nodiscard]] auto getSize() const -> std::pair<int, int>;

    [[nodiscard]] bool isMaximized() const;
    void maximize() const;

    /// Minimized windows skip rendering entirely.
    [[nodiscard]] bool isIconified() const;

  private:
    GLFWwindow* m_Handle = nullptr;
};

} // namespace Core
