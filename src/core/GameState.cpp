#include "core/GameState.hpp"
#include "core/Collision.hpp"
#include "core/LockMerge.hpp"

#include <utility>

namespace rustycubes::core {

namespace {

GameConfig validated(GameConfig config) {
    config.validate();
    return config;
}

} // namespace

GameState::GameState(GameConfig config)
    : GameState{config, PieceFactory{}}
{
}

GameState::GameState(GameConfig config, PieceFactory factory)
    : config_{validated(config)}
    , board_{config_.columns, config_.rows}
    , factory_{std::move(factory)}
    , activePiece_{}
    , status_{GameStatus::NotStarted}
{
}

void GameState::start() {
    if (status_ == GameStatus::Running) return;

    board_ = Board(config_.columns, config_.rows); // reset grid
    activePiece_.reset();
    lockedPieces_ = 0;
    clearedRows_ = 0;

    status_ = GameStatus::Running;

    if (!spawnPiece()) {
        status_ = GameStatus::GameOver;
    }
}

void GameState::pause() {
    if (status_ == GameStatus::Running) {
        status_ = GameStatus::Paused;
    }
}

void GameState::resume() {
    if (status_ == GameStatus::Paused) {
        status_ = GameStatus::Running;
    }
}

void GameState::reset() {
    board_ = Board(config_.columns, config_.rows);
    activePiece_.reset();
    lockedPieces_ = 0;
    clearedRows_ = 0;
    status_ = GameStatus::NotStarted;
}

void GameState::refresh() {
    if (activePiece_) {
        activePiece_->recomputePositions();
    }
}

TickResult GameState::tick() {
    if (status_ != GameStatus::Running) {
        return TickResult::Idle;
    }

    if (!activePiece_) {
        if (!spawnPiece()) {
            status_ = GameStatus::GameOver;
            return TickResult::Blocked;
        }
    }

    activePiece_->recomputePositions();

    if (canFall(*activePiece_, board_)) {
        activePiece_->translate(0, 1);
        activePiece_->recomputePositions();
        return TickResult::Moved;
    }

    // Cannot move down => lock piece and spawn a new one
    lockActivePiece();

    if (!spawnPiece()) {
        status_ = GameStatus::GameOver;
        return TickResult::Blocked;
    }

    return TickResult::Locked;
}

bool GameState::moveLeft() {
    if (status_ != GameStatus::Running || !activePiece_) return false;
    return tryMove(Direction::Left);
}

bool GameState::moveRight() {
    if (status_ != GameStatus::Running || !activePiece_) return false;
    return tryMove(Direction::Right);
}

bool GameState::spawnPiece() {
    Piece next = factory_.create(config_.spawnAnchor);

    if (!fitsAt(next, board_)) {
        // Cannot spawn -> game over
        activePiece_.reset();
        return false;
    }

    activePiece_ = std::move(next);
    return true;
}

void GameState::lockActivePiece() {
    if (!activePiece_) return;

    const std::vector<Block> merged = blocksToMerge(*activePiece_);
    if (!lockPiece(*activePiece_, board_)) {
        return;
    }
    ++lockedPieces_;

    if (lockListener_) {
        lockListener_(*activePiece_, merged);
    }
    activePiece_.reset();

    if (config_.clearFullRows) {
        clearedRows_ += static_cast<std::uint64_t>(board_.clearFullRows());
    }
}

bool GameState::tryMove(Direction direction) {
    activePiece_->recomputePositions();

    if (!canMove(*activePiece_, board_, direction)) {
        return false;
    }

    activePiece_->translate(direction == Direction::Right ? 1 : -1, 0);
    activePiece_->recomputePositions();
    return true;
}

} // namespace rustycubes::core
