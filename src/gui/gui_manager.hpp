#pragma once

#include <memory>

union SDL_Event;

namespace splitline {

class WindowManager;
class SpeedrunPanel;
class RunTimer;
class Config;

class GuiManager {
public:
    GuiManager();
    ~GuiManager();

    // Disable copy
    GuiManager(const GuiManager&) = delete;
    GuiManager& operator=(const GuiManager&) = delete;

    // Initialize Dear ImGui
    bool initialize(WindowManager& window_manager);

    // Shutdown
    void shutdown();

    // Process SDL events
    void process_event(const SDL_Event& event);

    // Begin new frame
    void begin_frame();

    // Render all GUI elements
    void render(RunTimer& timer, Config& config);

    // End frame and render
    void end_frame();

private:
    bool m_initialized = false;

    // Panels
    std::unique_ptr<SpeedrunPanel> m_speedrun_panel;
};

} // namespace splitline
