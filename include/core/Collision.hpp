#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Piece.hpp"

namespace rustycubes::core {

// Pure queries used by both the gravity tick and the lateral moves.
// Positions outside the board count as solid.

// True if every active block can go one row down
bool canFall(const Piece& piece, const Board& board);

// True if every active block can go one column in the given direction
bool canMove(const Piece& piece, const Board& board, Direction direction);

// True if every active block is inside the board on an empty cell
bool fitsAt(const Piece& piece, const Board& board);

} // namespace rustycubes::core
