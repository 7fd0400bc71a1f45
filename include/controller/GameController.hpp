#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include "controller/StepScheduler.hpp"

namespace rustycubes::controller {

class GameController {
public:
    using Duration = StepScheduler::Duration;

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(rustycubes::core::GameState& game);

    /// Handle a single discrete player action, applied immediately.
    void handleAction(InputAction action);

    // Called once per poll with the time elapsed since the previous poll.
    // Always refreshes the piece's positions; runs at most one gravity
    // tick, when the scheduler says one is due.
    rustycubes::core::TickResult update(Duration elapsed);

    // Reset timing accumulator (e.g. when game is reset)
    void resetTiming();

    const StepScheduler& scheduler() const noexcept { return scheduler_; }

private:
    rustycubes::core::GameState& game_;
    StepScheduler scheduler_;
};

} // namespace rustycubes::controller
