#pragma once

#include "Board.hpp"
#include "Piece.hpp"
#include "PieceFactory.hpp"
#include "GameConfig.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace rustycubes::core {

enum class GameStatus {
    NotStarted,
    Running,
    Paused,
    GameOver
};

// Outcome of one gravity tick
enum class TickResult {
    Idle,    // not running, nothing happened
    Moved,   // active piece went down one row
    Locked,  // active piece locked, a new one was spawned
    Blocked  // no room for a new piece; game over
};

class GameState {
public:
    // Called after a piece is merged into the board, with the merged blocks
    using LockListener = std::function<void(const Piece&, const std::vector<Block>&)>;

    explicit GameState(GameConfig config = GameConfig{});
    GameState(GameConfig config, PieceFactory factory);

    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return board_; }
    const std::optional<Piece>& activePiece() const noexcept { return activePiece_; }

    GameStatus status() const noexcept { return status_; }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }
    std::uint64_t clearedRows() const noexcept { return clearedRows_; }

    std::chrono::milliseconds gravityInterval() const { return config_.gravityInterval(); }

    void setLockListener(LockListener listener) { lockListener_ = std::move(listener); }

    // Control API for the controller / input layer
    void start();
    void pause();
    void resume();
    void reset();

    // Visual refresh: recompute the active piece's block positions.
    // Never advances gravity.
    void refresh();

    // One gravity step
    TickResult tick();

    // Player actions; return true if the piece moved
    bool moveLeft();
    bool moveRight();

private:
    GameConfig config_;
    Board board_;
    PieceFactory factory_;

    std::optional<Piece> activePiece_;

    GameStatus status_{GameStatus::NotStarted};
    std::uint64_t lockedPieces_{0};
    std::uint64_t clearedRows_{0};

    LockListener lockListener_;

    bool spawnPiece();
    void lockActivePiece();
    bool tryMove(Direction direction);
};

} // namespace rustycubes::core
