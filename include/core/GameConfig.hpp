#pragma once

#include <chrono>

#include "core/Types.hpp"

namespace rustycubes::core {

struct GameConfig {
    int columns{10};
    int rows{20};
    GridPosition spawnAnchor{4, 0};

    float updatesPerSecond{1.0f};   // gravity ticks per second

    bool clearFullRows{false};      // opt-in; the classic rules never clear

    // Milliseconds between gravity ticks, 1000 / updatesPerSecond
    std::chrono::milliseconds gravityInterval() const;

    // Throws std::invalid_argument if the settings cannot describe a game
    void validate() const;
};

} // namespace rustycubes::core
