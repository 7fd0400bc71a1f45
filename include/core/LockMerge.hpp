#pragma once

#include "Board.hpp"
#include "Piece.hpp"
#include <vector>

namespace rustycubes::core {

// Blocks a piece leaves on the board when it locks, at their current positions
std::vector<Block> blocksToMerge(const Piece& piece);

// Write blocks into the board. Occupancy is a set, so merging the same
// blocks again leaves the board unchanged.
void mergeBlocks(Board& board, const std::vector<Block>& blocks);

// Merge the piece into the board and mark it locked.
// Returns false (and does nothing) if the piece was already locked.
bool lockPiece(Piece& piece, Board& board);

} // namespace rustycubes::core
