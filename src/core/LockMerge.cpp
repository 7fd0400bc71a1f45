#include "core/LockMerge.hpp"

namespace rustycubes::core {

std::vector<Block> blocksToMerge(const Piece& piece) {
    return piece.activeBlocks();
}

void mergeBlocks(Board& board, const std::vector<Block>& blocks) {
    for (const auto& b : blocks) {
        board.place(b);
    }
}

bool lockPiece(Piece& piece, Board& board) {
    if (piece.isLocked()) {
        return false;
    }

    mergeBlocks(board, blocksToMerge(piece));
    piece.markLocked();
    return true;
}

} // namespace rustycubes::core
