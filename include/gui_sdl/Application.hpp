#pragma once

#include <chrono>
#include <memory>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"

namespace rustycubes::gui_sdl {

// Owns the SDL window and renderer and drives one screen: each poll
// handles pending events, updates the screen with the elapsed whole
// milliseconds, then renders it.
class Application {
public:
    static constexpr int WindowWidth = 1024;
    static constexpr int WindowHeight = 920;

    Application() = default;
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Opens the fixed-size window; returns false (after logging to stderr) on SDL failure
    bool init(const char* title);

    // Runs until the window is closed or requestQuit() is called
    int run(std::unique_ptr<Screen> screen);

    void requestQuit() { running_ = false; }

    SDL_Renderer* renderer() const { return renderer_; }

private:
    using Clock = std::chrono::steady_clock;

    void pumpEvents();
    Screen::Duration takeElapsed();
    void drawFrame();
    void shutdown();

    bool running_{false};

    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};

    std::unique_ptr<Screen> screen_;

    // Advanced by whole milliseconds only; the sub-millisecond rest carries over
    Clock::time_point lastPoll_{};
};

} // namespace rustycubes::gui_sdl
