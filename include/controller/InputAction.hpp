#pragma once

namespace rustycubes::controller {

// Discrete player input actions, already decoded from keys by the frontend.
enum class InputAction {
    MoveLeft,
    MoveRight,
    PauseResume
};

} // namespace rustycubes::controller
