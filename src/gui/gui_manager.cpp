#include "gui_manager.hpp"
#include "speedrun_panel.hpp"
#include "core/window_manager.hpp"

#include <SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_opengl3.h>

#include <iostream>

namespace splitline {

GuiManager::GuiManager() = default;

GuiManager::~GuiManager() {
    shutdown();
}

bool GuiManager::initialize(WindowManager& window_manager) {
    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();

    // No imgui.ini next to the binary
    io.IniFilename = nullptr;

    // Default font first so it stays the default, then a large one for the timer
    io.Fonts->AddFontDefault();
    ImFontConfig timer_font_config;
    timer_font_config.SizePixels = 32.0f;
    ImFont* timer_font = io.Fonts->AddFontDefault(&timer_font_config);

    // Setup style
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;

    // Setup Platform/Renderer backends
    if (!ImGui_ImplSDL2_InitForOpenGL(window_manager.get_window(),
                                      window_manager.get_gl_context())) {
        std::cerr << "Failed to initialize ImGui SDL2 backend" << std::endl;
        ImGui::DestroyContext();
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init("#version 330")) {
        std::cerr << "Failed to initialize ImGui OpenGL3 backend" << std::endl;
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    m_speedrun_panel = std::make_unique<SpeedrunPanel>(timer_font);

    m_initialized = true;
    std::cout << "GUI manager initialized" << std::endl;
    return true;
}

void GuiManager::shutdown() {
    if (m_initialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_initialized = false;
    }
}

void GuiManager::process_event(const SDL_Event& event) {
    ImGui_ImplSDL2_ProcessEvent(&event);
}

void GuiManager::begin_frame() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void GuiManager::render(RunTimer& timer, Config& config) {
    if (m_speedrun_panel) {
        m_speedrun_panel->render(timer, config);
    }
}

void GuiManager::end_frame() {
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

} // namespace splitline
