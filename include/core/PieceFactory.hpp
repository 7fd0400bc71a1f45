#pragma once

#include "Types.hpp"
#include "Piece.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace rustycubes::core {

class PieceFactory {
public:
    // Random kinds, seeded from std::random_device
    PieceFactory();

    // Random kinds, reproducible
    explicit PieceFactory(std::uint32_t seed);

    // Cycles through a fixed sequence of kinds (must not be empty)
    explicit PieceFactory(std::vector<PieceKind> sequence);

    PieceKind nextKind();

    // Create next piece at the given anchor
    Piece create(GridPosition anchor);

private:
    std::mt19937 rng_;
    std::vector<PieceKind> sequence_;
    std::size_t sequenceIndex_{0};
};

} // namespace rustycubes::core
