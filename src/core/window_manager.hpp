#pragma once

#include <string>
#include <cstdint>

struct SDL_Window;
typedef void* SDL_GLContext;

namespace splitline {

// Timer window: small, fixed size and kept above the game by default
struct WindowConfig {
    std::string title = "Splitline";
    int width = 340;
    int height = 560;
    bool always_on_top = true;
    bool vsync = true;
};

// Owns the SDL window and the OpenGL context ImGui draws into
class WindowManager {
public:
    WindowManager();
    ~WindowManager();

    WindowManager(const WindowManager&) = delete;
    WindowManager& operator=(const WindowManager&) = delete;

    bool initialize(const WindowConfig& config = WindowConfig{});
    void shutdown();

    // "Game - Category", or the application name for an untitled run
    void set_run_title(const std::string& game_name, const std::string& category_name);

    SDL_Window* get_window() const { return m_window; }
    SDL_GLContext get_gl_context() const { return m_gl_context; }

    // Frame management
    void clear(float r, float g, float b);
    void swap_buffers();

    // High-resolution timer for frame pacing
    static uint64_t get_ticks();
    static uint64_t get_performance_frequency();

private:
    SDL_Window* m_window = nullptr;
    SDL_GLContext m_gl_context = nullptr;
    std::string m_base_title;
};

} // namespace splitline
