#include "gui_sdl/Application.hpp"
#include "gui_sdl/PlayfieldScreen.hpp"

#include <exception>
#include <iostream>
#include <memory>

int main(int, char**) {
    try {
        rustycubes::gui_sdl::Application app;
        if (!app.init("RustyCubes - 0.1.0")) {
            return 1;
        }

        return app.run(std::make_unique<rustycubes::gui_sdl::PlayfieldScreen>());
    } catch (const std::exception& e) {
        std::cerr << "[GAME] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
