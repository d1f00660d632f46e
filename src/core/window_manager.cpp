#include "window_manager.hpp"

#include <SDL.h>
#include <SDL_opengl.h>
#include <iostream>

namespace splitline {

WindowManager::WindowManager() = default;

WindowManager::~WindowManager() {
    shutdown();
}

bool WindowManager::initialize(const WindowConfig& config) {
    m_base_title = config.title;

    // OpenGL 3.3 core, matching the "#version 330" ImGui backend
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    uint32_t window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_ALLOW_HIGHDPI;
    if (config.always_on_top) {
        window_flags |= SDL_WINDOW_ALWAYS_ON_TOP;
    }

    m_window = SDL_CreateWindow(config.title.c_str(),
                                SDL_WINDOWPOS_CENTERED,
                                SDL_WINDOWPOS_CENTERED,
                                config.width,
                                config.height,
                                window_flags);
    if (!m_window) {
        std::cerr << "Failed to create timer window: " << SDL_GetError() << std::endl;
        return false;
    }

    m_gl_context = SDL_GL_CreateContext(m_window);
    if (!m_gl_context) {
        std::cerr << "Failed to create OpenGL context: " << SDL_GetError() << std::endl;
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
        return false;
    }

    SDL_GL_MakeCurrent(m_window, m_gl_context);
    SDL_GL_SetSwapInterval(config.vsync ? 1 : 0);

    std::cout << "Timer window created: " << config.width << "x" << config.height << std::endl;
    return true;
}

void WindowManager::shutdown() {
    if (m_gl_context) {
        SDL_GL_DeleteContext(m_gl_context);
        m_gl_context = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
}

void WindowManager::set_run_title(const std::string& game_name, const std::string& category_name) {
    if (!m_window) {
        return;
    }

    std::string title = m_base_title;
    if (!game_name.empty()) {
        title = game_name;
        if (!category_name.empty()) {
            title += " - " + category_name;
        }
    }
    SDL_SetWindowTitle(m_window, title.c_str());
}

void WindowManager::clear(float r, float g, float b) {
    int width = 0;
    int height = 0;
    SDL_GL_GetDrawableSize(m_window, &width, &height);
    glViewport(0, 0, width, height);
    glClearColor(r, g, b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void WindowManager::swap_buffers() {
    if (m_window) {
        SDL_GL_SwapWindow(m_window);
    }
}

uint64_t WindowManager::get_ticks() {
    return SDL_GetPerformanceCounter();
}

uint64_t WindowManager::get_performance_frequency() {
    return SDL_GetPerformanceFrequency();
}

} // namespace splitline
