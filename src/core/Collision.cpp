#include "core/Collision.hpp"

namespace rustycubes::core {

namespace {

bool isSolid(const Board& board, GridPosition pos) {
    return !board.contains(pos) || board.isOccupied(pos);
}

template <typename Fn>
bool allActiveBlocks(const Piece& piece, Fn&& fn) {
    for (const auto& row : piece.blocks()) {
        for (const auto& b : row) {
            if (b.active && !fn(b)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

bool canFall(const Piece& piece, const Board& board) {
    return allActiveBlocks(piece, [&board](const Block& b) {
        const GridPosition below{b.position.x, b.position.y + 1};
        if (below.y > board.rows() - 1) {
            return false; // floor
        }
        return !isSolid(board, below);
    });
}

bool canMove(const Piece& piece, const Board& board, Direction direction) {
    const int dx = (direction == Direction::Right) ? 1 : -1;

    const int anchorCol = piece.anchor().x;
    if (direction == Direction::Right && anchorCol >= board.columns() - 1) {
        return false;
    }
    if (direction == Direction::Left && anchorCol <= 0) {
        return false;
    }

    return allActiveBlocks(piece, [&board, dx](const Block& b) {
        return !isSolid(board, GridPosition{b.position.x + dx, b.position.y});
    });
}

bool fitsAt(const Piece& piece, const Board& board) {
    return allActiveBlocks(piece, [&board](const Block& b) {
        return !isSolid(board, b.position);
    });
}

} // namespace rustycubes::core
