#pragma once

#include <string>
#include <memory>

namespace splitline {

class WindowManager;
class GuiManager;
class RunTimer;
class Config;

// Main application class - owns the timer, its configuration and the window
class Application {
public:
    Application();
    ~Application();

    // Disable copy
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Initialize all subsystems
    bool initialize(int argc, char* argv[]);

    // Main loop
    void run();

    // Shutdown and cleanup
    void shutdown();

    void request_quit() { m_quit_requested = true; }

private:
    bool parse_command_line(int argc, char* argv[], std::string& config_path);
    void print_usage(const char* program_name);
    void print_version();

    void process_events();
    void render();

    // Subsystems
    std::unique_ptr<WindowManager> m_window_manager;
    std::unique_ptr<GuiManager> m_gui_manager;
    std::unique_ptr<Config> m_config;
    std::unique_ptr<RunTimer> m_timer;

    // State
    bool m_running = false;
    bool m_quit_requested = false;
    bool m_sdl_initialized = false;
};

} // namespace splitline
