#include "pente/GameUtils.hpp"
#include "pente/PenteGame.hpp"
#include "pente/Profiler.hpp"
#include "pente/Search.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using pente::GameUtils;
using pente::PenteGame;
using pente::Search;

namespace {

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [mode] [depth] [--ai-vs-ai] [--tournament] [--time ms]"
              << " [--moves \"1. K10 L9 2. ...\"] [--verbose]\n"
              << "  mode: minimax_h1 | minimax_h2 | alphabeta_h1 | alphabeta_h2 (default alphabeta_h2)\n"
              << "  depth: search depth, 1-3 is practical (default 2)\n";
}

// Returns an invalid move on quit or end of input
PenteGame::Move readHumanMove(const PenteGame& game) {
    while (true) {
        std::cout << "Your move (e.g. K10, q to quit): " << std::flush;
        std::string input;
        if (!std::getline(std::cin, input) || input == "q" || input == "quit") {
            return PenteGame::Move();
        }

        auto [row, col] = GameUtils::parseMove(input.c_str());
        if (row < 0 || !game.isLegalMove(row, col)) {
            std::cout << "Invalid or illegal move: " << input << std::endl;
            continue;
        }
        return PenteGame::Move(row, col);
    }
}

} // namespace

// How to run: ./pente alphabeta_h2 2
//             ./pente minimax_h1 2 --ai-vs-ai --moves "1. K10 L9 2. N10"
int main(int argc, char* argv[]) {
    Search::Config baseConfig;
    bool aiVsAi = false;
    bool tournament = false;
    const char* openingMoves = nullptr;
    int positional = 0;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--ai-vs-ai") {
                aiVsAi = true;
            } else if (arg == "--tournament") {
                tournament = true;
            } else if (arg == "--verbose") {
                baseConfig.verbose = true;
            } else if (arg == "--time" && i + 1 < argc) {
                baseConfig.timeLimitMs = std::stoi(argv[++i]);
            } else if (arg == "--moves" && i + 1 < argc) {
                openingMoves = argv[++i];
            } else if (positional == 0) {
                if (!pente::parseMode(arg, baseConfig.algorithm, baseConfig.heuristic)) {
                    std::cerr << "Unknown mode: " << arg << "\n";
                    printUsage(argv[0]);
                    return 1;
                }
                positional++;
            } else if (positional == 1) {
                baseConfig.depth = std::stoi(arg);
                positional++;
            } else {
                std::cerr << "Unexpected argument: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
        baseConfig.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Argument out of range: " << e.what() << "\n";
        return 1;
    }

    PenteGame game(tournament ? PenteGame::Config::tournament() : PenteGame::Config::standard());

    if (openingMoves) {
        for (const auto& moveStr : GameUtils::parseGameString(openingMoves)) {
            if (!game.makeMove(moveStr.c_str())) {
                std::cerr << "Illegal opening move: " << moveStr << "\n";
                return 1;
            }
        }
    }

    // One engine per AI seat. Black is the human unless AI vs AI.
    std::unique_ptr<Search> blackAi;
    std::unique_ptr<Search> whiteAi;

    Search::Config whiteConfig = baseConfig;
    whiteConfig.player = PenteGame::WHITE;
    whiteAi = std::make_unique<Search>(whiteConfig);

    if (aiVsAi) {
        Search::Config blackConfig = baseConfig;
        blackConfig.player = PenteGame::BLACK;
        blackAi = std::make_unique<Search>(blackConfig);
    }

    std::cout << "Playing Pente: " << pente::algorithmName(baseConfig.algorithm) << " + "
              << pente::heuristicName(baseConfig.heuristic) << ", depth " << baseConfig.depth
              << (aiVsAi ? ", AI vs AI" : ", you are Black") << std::endl;

    std::vector<std::string> moves;
    double blackTotalTime = 0.0;
    double whiteTotalTime = 0.0;

    while (!game.isGameOver()) {
        GameUtils::printGameState(game);

        PenteGame::Player toMove = game.getCurrentPlayer();
        Search* ai = (toMove == PenteGame::BLACK) ? blackAi.get() : whiteAi.get();
        PenteGame::Move move;

        if (ai) {
            std::cout << (toMove == PenteGame::BLACK ? "Black" : "White") << " AI thinking..." << std::endl;
            move = ai->getBestMove(game);
            if (!move.isValid()) {
                std::cout << "No moves left. Draw.\n";
                break;
            }

            (toMove == PenteGame::BLACK ? blackTotalTime : whiteTotalTime) += ai->getLastSearchSeconds();
            std::cout << "Selected move: " << GameUtils::displayMove(move.row, move.col)
                      << (ai->wasForcedMove() ? " (forced)" : "")
                      << " | time " << ai->getLastSearchSeconds() << "s"
                      << " | nodes " << GameUtils::formatWithCommas(ai->getNodesExplored())
                      << " | pruned " << GameUtils::formatWithCommas(ai->getPrunedBranches()) << "\n";
        } else {
            if (game.isFull()) {
                std::cout << "No moves left. Draw.\n";
                break;
            }
            move = readHumanMove(game);
            if (!move.isValid()) {
                std::cout << "Game abandoned.\n";
                return 0;
            }
        }

        if (!game.makeMove(move.row, move.col, toMove)) {
            std::cerr << "Engine produced an illegal move: " << GameUtils::displayMove(move.row, move.col) << "\n";
            return 1;
        }
        moves.push_back(GameUtils::displayMove(move.row, move.col));
    }

    GameUtils::printGameState(game);

    std::cout << "Moves: ";
    for (const auto& moveStr : moves) {
        std::cout << moveStr << " ";
    }
    std::cout << "\n";

    PenteGame::Player winner = game.getWinner();
    if (winner == PenteGame::BLACK) {
        std::cout << "Winner: Black\n";
    } else if (winner == PenteGame::WHITE) {
        std::cout << "Winner: White\n";
    }

    std::cout << "Black AI total time: " << blackTotalTime << "s\n";
    std::cout << "White AI total time: " << whiteTotalTime << "s\n";

    pente::Profiler::instance().printReport();
    return 0;
}
