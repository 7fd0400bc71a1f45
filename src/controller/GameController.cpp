#include "controller/GameController.hpp"

namespace rustycubes::controller {

GameController::GameController(rustycubes::core::GameState& game)
    : game_{game}
    , scheduler_{game.gravityInterval()}
{
}

void GameController::handleAction(InputAction action) {
    using core::GameStatus;

    // If the game is over, only allow a reset from outside
    if (game_.status() == GameStatus::GameOver) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        game_.moveLeft();
        break;
    case InputAction::MoveRight:
        game_.moveRight();
        break;
    case InputAction::PauseResume:
        if (game_.status() == GameStatus::Running) {
            game_.pause();
        } else if (game_.status() == GameStatus::Paused) {
            game_.resume();
        }
        break;
    }
}

rustycubes::core::TickResult GameController::update(Duration elapsed) {
    using core::GameStatus;
    using core::TickResult;

    game_.refresh();

    if (game_.status() != GameStatus::Running) {
        return TickResult::Idle;
    }

    if (!scheduler_.poll(elapsed)) {
        return TickResult::Idle;
    }

    return game_.tick();
}

void GameController::resetTiming() {
    scheduler_.setInterval(game_.gravityInterval());
    scheduler_.reset();
}

} // namespace rustycubes::controller
