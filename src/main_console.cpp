#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/GameState.hpp"
#include "core/GameConfig.hpp"
#include "core/PieceFactory.hpp"
#include "core/Board.hpp"
#include "core/Piece.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"

using namespace rustycubes::core;

namespace {

char kindLetter(PieceKind kind) {
    switch (kind) {
    case PieceKind::I: return 'I';
    case PieceKind::J: return 'J';
    case PieceKind::L: return 'L';
    case PieceKind::O: return 'O';
    case PieceKind::S: return 'S';
    case PieceKind::T: return 'T';
    case PieceKind::Z: return 'Z';
    }
    return '?';
}

// Helper: render the current board + active piece as ASCII
void printGame(const GameState& game) {
    const Board& board = game.board();
    const int rows = board.rows();
    const int cols = board.columns();

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    // Locked blocks show the letter of the piece that left them
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const Cell& c = board.cell({x, y});
            if (c.occupied) {
                lines[y][x] = kindLetter(c.block->kind);
            }
        }
    }

    // Overlay active piece as '#'
    if (game.activePiece()) {
        for (const auto& b : game.activePiece()->activeBlocks()) {
            if (board.contains(b.position)) {
                lines[b.position.y][b.position.x] = '#';
            }
        }
    }

    std::cout << "\n==== RUSTYCUBES CONSOLE VIEW ====\n";
    std::cout << "Locked: " << game.lockedPieces()
              << " | Rows cleared: " << game.clearedRows()
              << " | Status: ";

    switch (game.status()) {
    case GameStatus::NotStarted: std::cout << "NotStarted"; break;
    case GameStatus::Running:    std::cout << "Running";    break;
    case GameStatus::Paused:     std::cout << "Paused";     break;
    case GameStatus::GameOver:   std::cout << "GameOver";   break;
    }
    std::cout << '\n';

    // Print board with borders
    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int y = 0; y < rows; ++y) {
        std::cout << '|' << lines[y] << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, g = gravity tick\n"
              << "  p = pause/resume, r = reset+start, q = quit\n";
}

void printUsage(const char* prog) {
    std::cerr << "Usage:\n  " << prog
              << " [--ups <updates per second>] [--seed <n>] [--clear-rows]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    GameConfig config{};
    std::optional<std::uint32_t> seed;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--ups" && i + 1 < argc) {
                config.updatesPerSecond = std::stof(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--clear-rows") {
                config.clearFullRows = true;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] Invalid arguments: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "[CONFIG] Board " << config.columns << "x" << config.rows
              << ", gravity every " << config.gravityInterval().count() << " ms"
              << (config.clearFullRows ? ", full rows clear" : "") << std::endl;

    try {
        GameState game = seed ? GameState{config, PieceFactory{*seed}} : GameState{config};
        rustycubes::controller::GameController controller{game};

        game.setLockListener([](const Piece& piece, const std::vector<Block>& merged) {
            std::cout << "[GAME] Locked " << kindLetter(piece.kind())
                      << " at x: " << piece.anchor().x << " , y: " << piece.anchor().y
                      << " (" << merged.size() << " blocks)" << std::endl;
        });

        game.start(); // start immediately

        std::string cmd;
        printGame(game);

        while (true) {
            std::cout << "\nEnter command: ";
            if (!std::getline(std::cin, cmd)) {
                break; // EOF
            }
            if (cmd.empty()) {
                continue;
            }

            char c = cmd[0];
            if (c == 'q' || c == 'Q') {
                std::cout << "Quitting.\n";
                break;
            }

            using rustycubes::controller::InputAction;

            switch (c) {
            case 'a': case 'A':
                controller.handleAction(InputAction::MoveLeft);
                break;
            case 'd': case 'D':
                controller.handleAction(InputAction::MoveRight);
                break;
            case 'g': case 'G':
                controller.update(game.gravityInterval());
                break;
            case 'p': case 'P':
                controller.handleAction(InputAction::PauseResume);
                break;
            case 'r': case 'R':
                game.reset();
                game.start();
                controller.resetTiming();
                break;
            default:
                std::cout << "Unknown command: " << c << '\n';
                break;
            }

            printGame(game);

            if (game.status() == GameStatus::GameOver) {
                std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[GAME] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
