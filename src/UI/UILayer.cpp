#include "UILayer.h"

#include "Core/Application.h"

#include <spdlog/spdlog.h>

// GLFW pulls in the system OpenGL header for glClear/glClearColor.
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

namespace UI
{

namespace
{
// Scale the default font to the primary monitor's content scale
float contentScale()
{
    float scaleX = 1.0F;
    float scaleY = 1.0F;

    GLFWmonitor* monitor = glfwGetPrimaryMonitor();
    if (monitor != nullptr)
    {
        glfwGetMonitorContentScale(monitor, &scaleX, &scaleY);
    }
    return scaleX > 0.0F ? scaleX : 1.0F;
}
} // namespace

UILayer::UILayer() : Layer("UILayer")
{
}

UILayer::~UILayer() = default;

void UILayer::onAttach()
{
    spdlog::info("UILayer: initializing ImGui {}", IMGUI_VERSION);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& imguiIO = ImGui::GetIO();
    imguiIO.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    // Window geometry is stored in the TOML config instead
    imguiIO.IniFilename = nullptr;

    const float scale = contentScale();
    imguiIO.FontGlobalScale = scale;

    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(scale);

    GLFWwindow* window = Core::Application::get().getWindow().getHandle();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330 core");

    spdlog::info("UILayer: ImGui initialized (content scale {:.2f})", scale);
}

void UILayer::onDetach()
{
    spdlog::info("UILayer: shutting down ImGui");

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}

void UILayer::onRender()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImVec4& background = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
    glClearColor(background.x, background.y, background.z, background.w);
    glClear(GL_COLOR_BUFFER_BIT);
}

void UILayer::onPostRender()
{
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

} // namespace UI
