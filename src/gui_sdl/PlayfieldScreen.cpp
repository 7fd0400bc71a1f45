#include "gui_sdl/PlayfieldScreen.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "controller/InputAction.hpp"
#include "core/Board.hpp"
#include "core/Piece.hpp"
#include "core/ShapeCatalog.hpp"

namespace rustycubes::gui_sdl {

namespace {

void setColor(SDL_Renderer* renderer, rustycubes::core::Color c, std::uint8_t alpha = 255)
{
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, alpha);
}

SDL_Rect cellRect(rustycubes::core::GridPosition pos)
{
    return SDL_Rect{pos.x * Layout::cellSize + Layout::gridX + 1,
                    pos.y * Layout::cellSize + Layout::gridY + 1,
                    Layout::cellSize, Layout::cellSize};
}

} // namespace

PlayfieldScreen::PlayfieldScreen(rustycubes::core::GameConfig config)
    : gameState_(config)
    , controller_(gameState_)
{
    gameState_.setLockListener([](const rustycubes::core::Piece& piece,
                                  const std::vector<rustycubes::core::Block>&) {
        std::fprintf(stdout, "[GAME] Piece locked at x: %d , y: %d\n",
                     piece.anchor().x, piece.anchor().y);
    });

    gameState_.start();
    controller_.resetTiming();
}

void PlayfieldScreen::restart()
{
    gameState_.reset();
    gameState_.start();
    controller_.resetTiming();
}

void PlayfieldScreen::handleEvent(Application& app, const SDL_Event& e)
{
    using rustycubes::controller::InputAction;

    if (e.type != SDL_KEYDOWN) {
        return;
    }

    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
        case SDLK_a:
            controller_.handleAction(InputAction::MoveLeft);
            break;
        case SDLK_RIGHT:
        case SDLK_d:
            controller_.handleAction(InputAction::MoveRight);
            break;
        case SDLK_p:
            if (e.key.repeat == 0) controller_.handleAction(InputAction::PauseResume);
            break;
        case SDLK_r:
            if (e.key.repeat == 0) restart();
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void PlayfieldScreen::update(Application&, Duration elapsed)
{
    controller_.update(elapsed);
}

void PlayfieldScreen::render(Application& app)
{
    SDL_Renderer* renderer = app.renderer();

    renderGrid(renderer);

    const auto& board = gameState_.board();
    for (int y = 0; y < board.rows(); ++y) {
        for (int x = 0; x < board.columns(); ++x) {
            const auto& cell = board.cell({x, y});
            if (cell.occupied) {
                renderBlock(renderer, *cell.block);
            }
        }
    }

    if (gameState_.activePiece().has_value()) {
        for (const auto& row : gameState_.activePiece()->blocks()) {
            for (const auto& b : row) {
                if (b.active && b.rendered) {
                    renderBlock(renderer, b);
                }
            }
        }
    }

    using rustycubes::core::GameStatus;
    if (gameState_.status() == GameStatus::Paused ||
        gameState_.status() == GameStatus::GameOver)
    {
        SDL_Rect boardRect{Layout::gridX, Layout::gridY,
                           board.columns() * Layout::cellSize + 2,
                           board.rows() * Layout::cellSize + 2};
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 160);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void PlayfieldScreen::renderGrid(SDL_Renderer* renderer) const
{
    const auto& board = gameState_.board();

    // White 2px outline per cell
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    for (int y = 0; y < board.rows(); ++y) {
        for (int x = 0; x < board.columns(); ++x) {
            SDL_Rect outer = cellRect({x, y});
            SDL_Rect inner{outer.x + 1, outer.y + 1, outer.w - 2, outer.h - 2};
            SDL_RenderDrawRect(renderer, &outer);
            SDL_RenderDrawRect(renderer, &inner);
        }
    }
}

void PlayfieldScreen::renderBlock(SDL_Renderer* renderer, const rustycubes::core::Block& block) const
{
    if (!gameState_.board().contains(block.position)) {
        return;
    }

    const auto colors = rustycubes::core::colorsFor(block.kind);

    SDL_Rect outer = cellRect(block.position);
    setColor(renderer, colors.primary);
    SDL_RenderFillRect(renderer, &outer);

    SDL_Rect inner{outer.x + 2, outer.y + 2, Layout::blockInnerSize, Layout::blockInnerSize};
    setColor(renderer, colors.secondary);
    SDL_RenderFillRect(renderer, &inner);
}

} // namespace rustycubes::gui_sdl
