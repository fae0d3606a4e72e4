#include "Window.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

// GLFW pulls in the system OpenGL header; only GL 1.x entry points are called here.
#include <GLFW/glfw3.h>

namespace Core
{

namespace
{

constexpr int MaxDimension = 16384;

void onFramebufferResized(GLFWwindow* /*window*/, int width, int height)
{
    glViewport(0, 0, std::clamp(width, 0, MaxDimension), std::clamp(height, 0, MaxDimension));
}

} // namespace

Window::Window(const WindowSpecification& spec)
{
    // Sizes come from the user config; GLFW rejects non-positive ones
    const int width = std::clamp(spec.Width, 1, MaxDimension);
    const int height = std::clamp(spec.Height, 1, MaxDimension);
    spdlog::info("Window: creating '{}' ({}x{})", spec.Title, width, height);

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    // NOLINTNEXTLINE(cppcoreguidelines-prefer-member-initializer) - hints must precede creation
    m_Handle = glfwCreateWindow(width, height, spec.Title.c_str(), nullptr, nullptr);
    if (m_Handle == nullptr)
    {
        spdlog::critical("Window: glfwCreateWindow failed");
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(m_Handle);
    glfwSwapInterval(spec.VSync ? 1 : 0);
    glfwSetFramebufferSizeCallback(m_Handle, onFramebufferResized);

    const auto* version = glGetString(GL_VERSION);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) - GLubyte string
    spdlog::debug("Window: OpenGL {}", version != nullptr ? reinterpret_cast<const char*>(version) : "<unknown>");
}

Window::~Window()
{
    glfwDestroyWindow(m_Handle);
}

void Window::swapBuffers() const
{
    glfwSwapBuffers(m_Handle);
}

bool Window::shouldClose() const
{
    return glfwWindowShouldClose(m_Handle) != 0;
}

void Window::setPosition(int x, int y) const
{
    glfwSetWindowPos(m_Handle, x, y);
}

auto Window::getPosition() const -> std::pair<int, int>
{
    std::pair<int, int> position{0, 0};
    glfwGetWindowPos(m_Handle, &position.first, &position.second);
    return position;
}

auto Window::getSize() const -> std::pair<int, int>
{
    std::pair<int, int> size{0, 0};
    glfwGetWindowSize(m_Handle, &size.first, &size.second);
    return size;
}

bool Window::isMaximized() const
{
    return glfwGetWindowAttrib(m_Handle, GLFW_MAXIMIZED) != 0;
}

void Window::maximize() const
{
    glfwMaximizeWindow(m_Handle);
}

bool Window::isIconified() const
{
    return glfwGetWindowAttrib(m_Handle, GLFW_ICONIFIED) != 0;
}

} // namespace Core
