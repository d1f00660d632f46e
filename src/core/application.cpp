#include "application.hpp"
#include "config.hpp"
#include "run_timer.hpp"
#include "window_manager.hpp"
#include "gui/gui_manager.hpp"

#include <SDL.h>
#include <iostream>
#include <cstring>

namespace splitline {

namespace {

// Refresh period of the timer window
constexpr double kTargetFrameTime = 1.0 / 60.0;

// A fresh run has a single unnamed segment
Run make_default_run() {
    Run run;
    run.segments.push_back(Segment{});
    return run;
}

} // namespace

Application::Application() = default;

Application::~Application() = default;

void Application::print_usage(const char* program_name) {
    std::cout << "Splitline - a speedrun timer\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help           Show this help message and exit\n";
    std::cout << "  -v, --version        Show version information and exit\n";
    std::cout << "  -c, --config <file>  Configuration file (default: "
              << Config::get_default_path() << ")\n";
}

void Application::print_version() {
    std::cout << "Splitline v0.1.0\n";
}

bool Application::parse_command_line(int argc, char* argv[], std::string& config_path) {
    config_path = Config::get_default_path();

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return false;  // Signal to exit
        }
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return false;  // Signal to exit
        }
        else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing file name after " << arg << "\n";
                return false;
            }
            config_path = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }

    return true;
}

bool Application::initialize(int argc, char* argv[]) {
    std::string config_path;
    if (!parse_command_line(argc, argv, config_path)) {
        m_running = false;
        return true;  // Not an error, just exit gracefully
    }

    m_config = std::make_unique<Config>();
    if (!m_config->load(config_path)) {
        std::cout << "Using default configuration" << std::endl;
    }

    m_timer = std::make_unique<RunTimer>(make_default_run());
    m_timer->set_current_comparison(m_config->general.comparison);
    if (m_config->is_game_time()) {
        m_timer->set_timing_method(TimingMethod::GameTime);
    }

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "Failed to initialize SDL: " << SDL_GetError() << std::endl;
        return false;
    }
    m_sdl_initialized = true;

    m_window_manager = std::make_unique<WindowManager>();
    m_gui_manager = std::make_unique<GuiManager>();

    if (!m_window_manager->initialize()) {
        std::cerr << "Failed to initialize window manager" << std::endl;
        return false;
    }
    m_window_manager->set_run_title(m_timer->run().game_name, m_timer->run().category_name);

    if (!m_gui_manager->initialize(*m_window_manager)) {
        std::cerr << "Failed to initialize GUI manager" << std::endl;
        return false;
    }

    m_running = true;
    std::cout << "Splitline initialized successfully" << std::endl;
    return true;
}

void Application::run() {
    while (m_running && !m_quit_requested) {
        uint64_t frame_start = WindowManager::get_ticks();
        double frequency = static_cast<double>(WindowManager::get_performance_frequency());

        process_events();
        render();

        uint64_t frame_end = WindowManager::get_ticks();
        double frame_time = static_cast<double>(frame_end - frame_start) / frequency;

        if (frame_time < kTargetFrameTime) {
            double sleep_time = (kTargetFrameTime - frame_time) * 1000.0;
            SDL_Delay(static_cast<uint32_t>(sleep_time));
        }
    }
}

void Application::shutdown() {
    if (m_gui_manager) {
        m_gui_manager->shutdown();
    }
    if (m_window_manager) {
        m_window_manager->shutdown();
    }

    if (m_sdl_initialized) {
        SDL_Quit();
        m_sdl_initialized = false;
        std::cout << "Splitline shutdown complete" << std::endl;
    }
}

void Application::process_events() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        m_gui_manager->process_event(event);

        switch (event.type) {
            case SDL_QUIT:
                m_quit_requested = true;
                break;

            case SDL_WINDOWEVENT:
                if (event.window.event == SDL_WINDOWEVENT_CLOSE) {
                    m_quit_requested = true;
                }
                break;
        }
    }
}

void Application::render() {
    m_window_manager->clear(0.1f, 0.1f, 0.1f);
    m_gui_manager->begin_frame();
    m_gui_manager->render(*m_timer, *m_config);
    m_gui_manager->end_frame();
    m_window_manager->swap_buffers();
}

} // namespace splitline
