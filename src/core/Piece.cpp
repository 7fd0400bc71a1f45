#include "core/Piece.hpp"
#include <stdexcept>

namespace rustycubes::core {

Piece::Piece(PieceKind kind, GridPosition anchor)
    : kind_{kind}, anchor_{anchor}
{
}

Piece Piece::spawn(PieceKind kind, GridPosition anchor) {
    Piece p{kind, anchor};

    for (int row = 0; row < PieceFrameSize; ++row) {
        for (int col = 0; col < PieceFrameSize; ++col) {
            Block& b = p.blocks_[row][col];
            b.kind = kind;
            b.offset = GridPosition{col, row};
            b.active = false;
            b.rendered = false;
        }
    }

    for (const auto& cell : shapeFor(kind)) {
        Block& b = p.blocks_[cell.y][cell.x];
        b.active = true;
        b.rendered = true;
    }

    p.recomputePositions();
    return p;
}

const Block& Piece::block(int col, int row) const {
    if (col < 0 || col >= PieceFrameSize || row < 0 || row >= PieceFrameSize) {
        throw std::out_of_range("Piece::block out of range");
    }
    return blocks_[row][col];
}

void Piece::recomputePositions() noexcept {
    for (auto& row : blocks_) {
        for (auto& b : row) {
            b.position = anchor_ + b.offset;
        }
    }
}

void Piece::translate(int dx, int dy) noexcept {
    anchor_.x += dx;
    anchor_.y += dy;
}

std::vector<Block> Piece::activeBlocks() const {
    std::vector<Block> result;
    result.reserve(BlocksPerPiece);
    for (const auto& row : blocks_) {
        for (const auto& b : row) {
            if (b.active && b.rendered) {
                result.push_back(b);
            }
        }
    }
    return result;
}

} // namespace rustycubes::core
