#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array

// Namespace for RustyCubes core types
namespace rustycubes::core {

// A cell on the grid. x is the column, y is the row (row 0 is the top).
// Used both for board coordinates and for offsets inside a piece.
struct GridPosition {
    int x{};
    int y{};
};

inline GridPosition operator+(GridPosition a, GridPosition b) noexcept {
    return GridPosition{a.x + b.x, a.y + b.y};
}

inline bool operator==(GridPosition a, GridPosition b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(GridPosition a, GridPosition b) noexcept {
    return !(a == b);
}

// Piece kinds
enum class PieceKind : std::uint8_t {
    I, J, L, O, S, T, Z
};

inline constexpr int PieceKindCount = 7;

inline constexpr std::array<PieceKind, PieceKindCount> allPieceKinds() {
    return {PieceKind::I, PieceKind::J, PieceKind::L, PieceKind::O,
            PieceKind::S, PieceKind::T, PieceKind::Z};
}

struct Color {
    std::uint8_t r{};
    std::uint8_t g{};
    std::uint8_t b{};
};

// Two-tone block colors: primary fills the outer rect, secondary the inner one
struct ColorPair {
    Color primary;
    Color secondary;
};

// Lateral movement commands
enum class Direction : std::uint8_t {
    Left,
    Right
};

// A sub-block of a falling piece, or the content of a landed cell.
// active: still part of a live piece (subject to gravity/collision).
// rendered: part of the piece's shape, drawn by frontends.
struct Block {
    PieceKind kind{PieceKind::I};
    GridPosition position{};
    GridPosition offset{};
    bool active{false};
    bool rendered{false};
};

} // namespace rustycubes::core
