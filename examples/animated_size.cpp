// Animated box size: two buttons change the target size, the box follows it.
//
// Built when GLIDE_BUILD_IMGUI_DEMO is on and GLFW, OpenGL and Dear ImGui
// are available.

#include <GLFW/glfw3.h>
#include <glide/animation_builder.hpp>
#include <glide/logger.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <string>

using namespace glide;

namespace
{

struct BoxView
{
    float       size;
    std::string label;
};

struct State
{
    float size = 50.0f;

    void adjust(float dx)
    {
        if (size == 0.0f && dx < 0.0f)
            return;
        size += dx;
    }
};

void draw_box(const BoxView& box)
{
    ImDrawList* dl  = ImGui::GetWindowDrawList();
    ImVec2      pos = ImGui::GetCursorScreenPos();
    ImVec2      end(pos.x + box.size, pos.y + box.size);

    const ImGuiStyle& style = ImGui::GetStyle();
    dl->AddRectFilled(pos, end, ImGui::GetColorU32(style.Colors[ImGuiCol_FrameBg]), 6.0f);
    dl->AddRect(pos, end, ImGui::GetColorU32(style.Colors[ImGuiCol_Border]), 6.0f, 0, 1.0f);

    ImVec2 text = ImGui::CalcTextSize(box.label.c_str());
    dl->AddText(ImVec2(pos.x + (box.size - text.x) * 0.5f, pos.y + (box.size - text.y) * 0.5f),
                ImGui::GetColorU32(ImGuiCol_Text),
                box.label.c_str());

    // Reserve the space so the widgets below move with the box.
    ImGui::Dummy(ImVec2(box.size, box.size));
}

}   // anonymous namespace

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    if (!glfwInit())
    {
        GLIDE_LOG_ERROR("example", "Failed to initialize GLFW");
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(640, 480, "Animated size", nullptr, nullptr);
    if (!window)
    {
        GLIDE_LOG_ERROR("example", "Failed to create window");
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    State                            state;
    AnimationBuilder<float, BoxView> animated_box(
        state.size,
        [](const float& size)
        { return BoxView{size, std::to_string(static_cast<int>(size))}; },
        easings::ease_out);
    animated_box.animates_layout(true);

    while (!glfwWindowShouldClose(window))
    {
        // Block while idle, poll while animating.
        if (animated_box.is_animating())
            glfwPollEvents();
        else
            glfwWaitEventsTimeout(0.5);

        animated_box.on_frame(Clock::now());

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
        ImGui::Begin("##root",
                     nullptr,
                     ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                         | ImGuiWindowFlags_NoSavedSettings);

        if (ImGui::Button("-50"))
        {
            state.adjust(-50.0f);
            animated_box.set_value(state.size);
        }
        ImGui::SameLine();
        if (ImGui::Button("+50"))
        {
            state.adjust(50.0f);
            animated_box.set_value(state.size);
        }

        draw_box(animated_box.build());
        ImGui::TextUnformatted("Animated size");

        ImGui::End();
        ImGui::Render();

        int w = 0;
        int h = 0;
        glfwGetFramebufferSize(window, &w, &h);
        glViewport(0, 0, w, h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
