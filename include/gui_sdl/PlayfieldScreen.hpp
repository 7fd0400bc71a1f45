#pragma once

#include "gui_sdl/Screen.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"

namespace rustycubes::gui_sdl {

// Window layout of the playfield, in pixels
struct Layout {
    static constexpr int gridX = 250;
    static constexpr int gridY = 80;
    static constexpr int cellSize = 36;       // block size + 4
    static constexpr int blockInnerSize = 31; // block size - 1
};

class PlayfieldScreen final : public Screen {
public:
    explicit PlayfieldScreen(rustycubes::core::GameConfig config = {});

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, Duration elapsed) override;
    void render(Application& app) override;

private:
    void renderGrid(SDL_Renderer* renderer) const;
    void renderBlock(SDL_Renderer* renderer, const rustycubes::core::Block& block) const;

    void restart();

private:
    rustycubes::core::GameState gameState_;
    rustycubes::controller::GameController controller_;
};

} // namespace rustycubes::gui_sdl
