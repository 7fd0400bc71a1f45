#pragma once

#include "Types.hpp"
#include <array>

namespace rustycubes::core {

inline constexpr int BlocksPerPiece = 4;

// Size of the local frame a shape lives in (4x4)
inline constexpr int PieceFrameSize = 4;

using Shape = std::array<GridPosition, BlocksPerPiece>;

// Occupied local cells of a kind, as (column, row) in the 4x4 frame
Shape shapeFor(PieceKind kind) noexcept;

// Two-tone color of a kind
ColorPair colorsFor(PieceKind kind) noexcept;

} // namespace rustycubes::core
