#pragma once

#include <SDL.h>

#include "controller/StepScheduler.hpp"

namespace rustycubes::gui_sdl {

class Application;

// Base interface for screens
class Screen {
public:
    using Duration = rustycubes::controller::StepScheduler::Duration;

    virtual ~Screen() = default;

    // Handle SDL events (keyboard/window)
    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Advance the simulation by the time elapsed since the previous poll
    virtual void update(Application& app, Duration elapsed) = 0;

    // SDL rendering
    virtual void render(Application& app) = 0;
};

} // namespace rustycubes::gui_sdl
