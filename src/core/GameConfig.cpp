#include "core/GameConfig.hpp"
#include "core/ShapeCatalog.hpp"

#include <cmath>
#include <stdexcept>

namespace rustycubes::core {

std::chrono::milliseconds GameConfig::gravityInterval() const {
    if (!std::isfinite(updatesPerSecond) || updatesPerSecond <= 0.0f) {
        throw std::invalid_argument("updatesPerSecond must be a positive finite number");
    }

    // Range-check in double before narrowing to the tick count
    const double ms = 1000.0 / static_cast<double>(updatesPerSecond);
    if (ms < 1.0) {
        throw std::invalid_argument("Gravity interval must be at least 1 ms");
    }
    if (ms >= static_cast<double>(std::chrono::milliseconds::max().count())) {
        throw std::invalid_argument("Gravity interval is too long");
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(ms)};
}

void GameConfig::validate() const {
    if (columns <= 0 || rows <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    if (columns < PieceFrameSize) {
        throw std::invalid_argument("Board must be at least as wide as a piece");
    }
    if (spawnAnchor.x < 0 || spawnAnchor.x >= columns ||
        spawnAnchor.y < 0 || spawnAnchor.y >= rows) {
        throw std::invalid_argument("Spawn anchor must lie on the board");
    }
    (void)gravityInterval(); // throws on a bad update rate
}

} // namespace rustycubes::core
