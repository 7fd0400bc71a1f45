#pragma once // Include guard

#include "Types.hpp" // For GridPosition, PieceKind, Block
#include "ShapeCatalog.hpp" // For PieceFrameSize
#include <array> // For std::array
#include <vector>

// Namespace for RustyCubes core types
namespace rustycubes::core {

// The falling piece: a kind, an anchor on the board and a 4x4 matrix of
// sub-blocks. Only the blocks of the kind's shape are active.
class Piece {
public:
    using Row = std::array<Block, PieceFrameSize>;
    using Matrix = std::array<Row, PieceFrameSize>; // indexed [row][column]

    static constexpr GridPosition DefaultSpawnAnchor{4, 0};

    // Build a piece of the given kind at anchor, positions already computed
    static Piece spawn(PieceKind kind, GridPosition anchor = DefaultSpawnAnchor);

    PieceKind kind() const noexcept { return kind_; }
    GridPosition anchor() const noexcept { return anchor_; }
    const Matrix& blocks() const noexcept { return blocks_; }

    // Block at local (column, row); throws std::out_of_range outside the 4x4 frame
    const Block& block(int col, int row) const;

    // position = anchor + offset for every block.
    // Call after any anchor change, before collision queries or rendering.
    void recomputePositions() noexcept;

    // Moves the anchor only. Legality is the caller's business (see Collision.hpp).
    void translate(int dx, int dy) noexcept;

    bool isLocked() const noexcept { return locked_; }
    void markLocked() noexcept { locked_ = true; }

    // Active rendered blocks, row-major
    std::vector<Block> activeBlocks() const;

private:
    Piece(PieceKind kind, GridPosition anchor);

    PieceKind kind_;
    GridPosition anchor_;
    Matrix blocks_{};
    bool locked_{false};
};

} // namespace rustycubes::core
