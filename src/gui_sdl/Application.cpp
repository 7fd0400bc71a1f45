#include "gui_sdl/Application.hpp"

#include <cstdio>
#include <utility>

namespace rustycubes::gui_sdl {

namespace {

constexpr Uint32 SubsystemFlags = SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS;

} // namespace

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title) {
    if (SDL_Init(SubsystemFlags) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    // Not resizable: the playfield uses fixed pixel coordinates
    window_ = SDL_CreateWindow(title,
                               SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               WindowWidth, WindowHeight,
                               SDL_WINDOW_SHOWN);
    if (!window_) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, -1,
                                   SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer_) {
        std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }

    if (SDL_RenderSetLogicalSize(renderer_, WindowWidth, WindowHeight) != 0) {
        std::fprintf(stderr, "SDL_RenderSetLogicalSize failed: %s\n", SDL_GetError());
        return false;
    }

    running_ = true;
    return true;
}

int Application::run(std::unique_ptr<Screen> screen) {
    screen_ = std::move(screen);
    if (!screen_) {
        return 1;
    }

    lastPoll_ = Clock::now();

    while (running_) {
        pumpEvents();
        if (!running_) {
            break;
        }

        screen_->update(*this, takeElapsed());
        drawFrame();
    }

    screen_.reset();
    return 0;
}

void Application::pumpEvents() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        if (e.type == SDL_QUIT) {
            running_ = false;
            continue;
        }
        screen_->handleEvent(*this, e);
    }
}

Screen::Duration Application::takeElapsed() {
    const auto elapsed =
        std::chrono::duration_cast<Screen::Duration>(Clock::now() - lastPoll_);
    lastPoll_ += elapsed;
    return elapsed;
}

void Application::drawFrame() {
    // Background: 0.1 grey
    SDL_SetRenderDrawColor(renderer_, 26, 26, 26, 255);
    SDL_RenderClear(renderer_);

    screen_->render(*this);

    SDL_RenderPresent(renderer_);
}

void Application::shutdown() {
    if (!SDL_WasInit(SubsystemFlags)) {
        return;
    }

    screen_.reset();

    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    SDL_Quit();
}

} // namespace rustycubes::gui_sdl
