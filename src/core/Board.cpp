#include "core/Board.hpp"
#include <stdexcept>

namespace rustycubes::core {

Board::Board(int columns, int rows)
    : columns_{columns}
    , rows_{rows}
{
    if (columns <= 0 || rows <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }

    cells_.resize(static_cast<std::size_t>(columns) * static_cast<std::size_t>(rows));
    for (int y = 0; y < rows_; ++y) {
        for (int x = 0; x < columns_; ++x) {
            cells_[index({x, y})].position = GridPosition{x, y};
        }
    }
}

bool Board::isOccupied(GridPosition pos) const {
    if (!contains(pos)) {
        throw std::out_of_range("Board::isOccupied out of range");
    }
    return cells_[index(pos)].occupied;
}

const Cell& Board::cell(GridPosition pos) const {
    if (!contains(pos)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return cells_[index(pos)];
}

void Board::place(const Block& block) {
    if (!contains(block.position)) {
        throw std::out_of_range("Board::place out of range");
    }

    Block frozen = block;
    frozen.active = false;
    frozen.rendered = true;

    Cell& c = cells_[index(block.position)];
    c.occupied = true;
    c.block = frozen;
}

int Board::occupiedCount() const noexcept {
    int count = 0;
    for (const auto& c : cells_) {
        if (c.occupied) {
            ++count;
        }
    }
    return count;
}

bool Board::isRowFull(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowFull out of range");
    }
    for (int x = 0; x < columns_; ++x) {
        if (!cells_[index({x, row})].occupied) {
            return false;
        }
    }
    return true;
}

int Board::clearFullRows() {
    int cleared = 0;

    // Go bottom-up: when we clear, we shift everything above down
    for (int row = rows_ - 1; row >= 0; --row) {
        if (!isRowFull(row)) {
            continue;
        }

        for (int r = row; r > 0; --r) {
            moveRow(r - 1, r);
        }
        emptyRow(0);

        ++cleared;
        ++row; // re-check this row index because we just pulled everything down
    }

    return cleared;
}

void Board::moveRow(int from, int to) {
    for (int x = 0; x < columns_; ++x) {
        const Cell& src = cells_[index({x, from})];
        Cell& dst = cells_[index({x, to})];
        dst.occupied = src.occupied;
        dst.block = src.block;
        if (dst.block) {
            dst.block->position = dst.position;
        }
    }
}

void Board::emptyRow(int row) {
    for (int x = 0; x < columns_; ++x) {
        Cell& c = cells_[index({x, row})];
        c.occupied = false;
        c.block.reset();
    }
}

} // namespace rustycubes::core
