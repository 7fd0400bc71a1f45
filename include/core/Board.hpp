#pragma once

#include "Types.hpp"
#include <vector>
#include <optional>

namespace rustycubes::core {

// One board cell. occupied == block.has_value() at all times.
struct Cell {
    GridPosition position{};
    bool occupied{false};
    std::optional<Block> block; // frozen copy of the landed block
};

class Board {
public:
    Board(int columns, int rows);

    int columns() const noexcept { return columns_; }
    int rows() const noexcept { return rows_; }

    bool contains(GridPosition pos) const noexcept {
        return pos.x >= 0 && pos.x < columns_ && pos.y >= 0 && pos.y < rows_;
    }

    // Bounds-checked; throws std::out_of_range outside the board.
    // Walls and floor are the collision checker's concern, not the board's.
    bool isOccupied(GridPosition pos) const;
    const Cell& cell(GridPosition pos) const;

    // Store a frozen copy of block at block.position and mark the cell occupied.
    // Throws std::out_of_range if the position is outside the board.
    void place(const Block& block);

    int occupiedCount() const noexcept;

    bool isRowFull(int row) const;

    // Remove full rows, pull everything above down, return number of cleared rows
    int clearFullRows();

private:
    int columns_;
    int rows_;
    std::vector<Cell> cells_; // rows_ * columns_, row-major

    int index(GridPosition pos) const noexcept {
        return pos.y * columns_ + pos.x;
    }

    void moveRow(int from, int to);
    void emptyRow(int row);
};

} // namespace rustycubes::core
