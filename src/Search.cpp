#include "pente/Search.hpp"
#include "pente/GameUtils.hpp"
#include "pente/Profiler.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace pente {

namespace {

constexpr Score INF = std::numeric_limits<Score>::max();

} // namespace

// ============================================================================
// Configuration
// ============================================================================

void Search::Config::validate() const {
    if (depth < 1) {
        throw std::invalid_argument("search depth must be at least 1, got " + std::to_string(depth));
    }
    if (player == PenteGame::NONE) {
        throw std::invalid_argument("search player must be BLACK or WHITE");
    }
    for (int radius : {minimaxRadius, alphaBetaRadius}) {
        if (radius < 1 || radius > 2) {
            throw std::invalid_argument("candidate radius must be 1 or 2, got " + std::to_string(radius));
        }
    }
    for (int width : {minimaxRootWidth, minimaxNodeWidth, alphaBetaRootWidth, alphaBetaNodeWidth}) {
        if (width < 1) {
            throw std::invalid_argument("candidate width must be positive, got " + std::to_string(width));
        }
    }
    if (timeLimitMs < 0) {
        throw std::invalid_argument("time limit must not be negative");
    }
}

Search::Search() : Search(Config()) {}

Search::Search(const Config& config) {
    setConfig(config);
}

void Search::setConfig(const Config& config) {
    config.validate();
    config_ = config;
    opponent_ = PenteGame::opponent(config_.player);

    // Dispatch once here instead of per node
    evaluator_ = makeEvaluator(config_.heuristic);
    rootSearch_ = (config_.algorithm == Algorithm::ALPHA_BETA) ? &Search::alphaBetaRoot
                                                                : &Search::minimaxRoot;
}

// ============================================================================
// Entry point
// ============================================================================

PenteGame::Move Search::getBestMove(PenteGame& game) {
    PENTE_PROFILE_SCOPE("Search::getBestMove");
    nodesExplored_ = 0;
    prunedBranches_ = 0;
    lastScore_ = 0;
    forcedMove_ = false;
    searchStart_ = std::chrono::steady_clock::now();

    PenteGame::Move move = findForcedMove(game);
    if (move.isValid()) {
        forcedMove_ = true;
    } else {
        move = (this->*rootSearch_)(game);
    }

    bestMove_ = move;
    lastSearchSeconds_ = std::chrono::duration<double>(std::chrono::steady_clock::now() - searchStart_).count();

    if (config_.verbose) {
        printStats();
    }
    return move;
}

PenteGame::Move Search::findForcedMove(PenteGame& game) {
    PENTE_PROFILE_SCOPE("Search::findForcedMove");
    int radius = std::max(config_.minimaxRadius, config_.alphaBetaRadius);
    std::vector<PenteGame::Move> candidates = game.getCandidateMoves(radius);

    // Win now
    for (const auto& move : candidates) {
        if (!game.makeMove(move.row, move.col, config_.player)) continue;
        bool wins = game.getWinner() == config_.player;
        game.undoMove();
        if (wins) {
            lastScore_ = WIN_SCORE;
            return move;
        }
    }

    // Deny the opponent's winning cell
    for (const auto& move : candidates) {
        if (!game.makeMove(move.row, move.col, opponent_)) continue;
        bool loses = game.getWinner() == opponent_;
        game.undoMove();
        if (loses && game.makeMove(move.row, move.col, config_.player)) {
            lastScore_ = evaluator_->evaluate(game, config_.player);
            game.undoMove();
            return move;
        }
    }

    return PenteGame::Move();
}

// ============================================================================
// Minimax
// ============================================================================

PenteGame::Move Search::minimaxRoot(PenteGame& game) {
    std::vector<PenteGame::Move> candidates =
        proximityOrdered(game, config_.minimaxRadius, config_.minimaxRootWidth);

    PenteGame::Move bestMove;
    Score bestScore = -INF;

    for (const auto& move : candidates) {
        if (bestMove.isValid() && outOfTime()) {
            if (config_.verbose) std::cout << "Soft time limit reached at the root\n";
            break;
        }
        if (!game.makeMove(move.row, move.col, config_.player)) continue;

        if (game.getWinner() == config_.player) {
            game.undoMove();
            lastScore_ = WIN_SCORE;
            return move;
        }

        Score score = minimax(game, config_.depth - 1, false);
        game.undoMove();

        if (score > bestScore) {
            bestScore = score;
            bestMove = move;
        }
    }

    lastScore_ = bestMove.isValid() ? bestScore : 0;
    return bestMove;
}

Score Search::minimax(PenteGame& game, int depth, bool maximizing) {
    nodesExplored_++;

    Score score;
    if (decidedScore(game, score)) {
        return score;
    }
    if (depth == 0) {
        return evaluator_->evaluate(game, config_.player);
    }

    PenteGame::Player mover = maximizing ? config_.player : opponent_;
    std::vector<PenteGame::Move> candidates =
        densityOrdered(game, config_.minimaxRadius, config_.minimaxNodeWidth);

    Score best = maximizing ? -INF : INF;
    bool searched = false;

    for (const auto& move : candidates) {
        if (!game.makeMove(move.row, move.col, mover)) continue;
        Score value = minimax(game, depth - 1, !maximizing);
        game.undoMove();

        best = maximizing ? std::max(best, value) : std::min(best, value);
        searched = true;
    }

    // Board exhausted
    if (!searched) {
        return evaluator_->evaluate(game, config_.player);
    }
    return best;
}

// ============================================================================
// Alpha-beta
// ============================================================================

PenteGame::Move Search::alphaBetaRoot(PenteGame& game) {
    std::vector<PenteGame::Move> candidates =
        scoreOrdered(game, config_.alphaBetaRadius, config_.alphaBetaRootWidth);

    PenteGame::Move bestMove;
    Score bestScore = -INF;
    Score alpha = -INF;
    Score beta = INF;

    for (const auto& move : candidates) {
        if (bestMove.isValid() && outOfTime()) {
            if (config_.verbose) std::cout << "Soft time limit reached at the root\n";
            break;
        }
        if (!game.makeMove(move.row, move.col, config_.player)) continue;

        if (game.getWinner() == config_.player) {
            game.undoMove();
            lastScore_ = WIN_SCORE;
            return move;
        }

        Score score = alphaBeta(game, config_.depth - 1, alpha, beta, false);
        game.undoMove();

        if (score > bestScore) {
            bestScore = score;
            bestMove = move;
        }
        alpha = std::max(alpha, score);
    }

    lastScore_ = bestMove.isValid() ? bestScore : 0;
    return bestMove;
}

Score Search::alphaBeta(PenteGame& game, int depth, Score alpha, Score beta, bool maximizing) {
    nodesExplored_++;

    Score score;
    if (decidedScore(game, score)) {
        return score;
    }
    if (depth == 0) {
        return evaluator_->evaluate(game, config_.player);
    }

    PenteGame::Player mover = maximizing ? config_.player : opponent_;
    std::vector<PenteGame::Move> candidates =
        densityOrdered(game, config_.alphaBetaRadius, config_.alphaBetaNodeWidth);

    Score best = maximizing ? -INF : INF;
    bool searched = false;

    for (const auto& move : candidates) {
        if (!game.makeMove(move.row, move.col, mover)) continue;
        Score value = alphaBeta(game, depth - 1, alpha, beta, !maximizing);
        game.undoMove();
        searched = true;

        if (maximizing) {
            best = std::max(best, value);
            alpha = std::max(alpha, value);
        } else {
            best = std::min(best, value);
            beta = std::min(beta, value);
        }

        if (beta <= alpha) {
            prunedBranches_++;
            break;
        }
    }

    if (!searched) {
        return evaluator_->evaluate(game, config_.player);
    }
    return best;
}

// ============================================================================
// Move ordering
// ============================================================================

std::vector<PenteGame::Move> Search::proximityOrdered(const PenteGame& game, int radius, int width) const {
    std::vector<PenteGame::Move> moves = game.getCandidateMoves(radius);

    PenteGame::Move last = game.getLastMove();
    if (last.isValid()) {
        auto distance = [&last](const PenteGame::Move& m) {
            return std::max(std::abs(m.row - last.row), std::abs(m.col - last.col));
        };
        // Stable keeps row-major order among equally distant cells
        std::stable_sort(moves.begin(), moves.end(),
                         [&distance](const PenteGame::Move& a, const PenteGame::Move& b) {
                             return distance(a) < distance(b);
                         });
    }

    if (static_cast<int>(moves.size()) > width) {
        moves.resize(width);
    }
    return moves;
}

std::vector<PenteGame::Move> Search::densityOrdered(const PenteGame& game, int radius, int width) const {
    std::vector<PenteGame::Move> moves = game.getCandidateMoves(radius);
    BitBoard occupied = game.getStones(PenteGame::BLACK) | game.getStones(PenteGame::WHITE);

    // Occupied cells in the 3x3 block around each candidate
    std::vector<std::pair<int, PenteGame::Move>> counted;
    counted.reserve(moves.size());
    for (const auto& move : moves) {
        int neighbours = 0;
        for (int dr = -1; dr <= 1; dr++) {
            for (int dc = -1; dc <= 1; dc++) {
                if (occupied.getBit(move.row + dr, move.col + dc)) neighbours++;
            }
        }
        counted.emplace_back(neighbours, move);
    }

    std::stable_sort(counted.begin(), counted.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    moves.clear();
    for (const auto& [neighbours, move] : counted) {
        if (static_cast<int>(moves.size()) >= width) break;
        moves.push_back(move);
    }
    return moves;
}

std::vector<PenteGame::Move> Search::scoreOrdered(PenteGame& game, int radius, int width) const {
    PENTE_PROFILE_SCOPE("Search::scoreOrdered");
    std::vector<std::pair<Score, PenteGame::Move>> scored;

    for (const auto& move : game.getCandidateMoves(radius)) {
        if (!game.makeMove(move.row, move.col, config_.player)) continue;
        scored.emplace_back(evaluator_->evaluate(game, config_.player), move);
        game.undoMove();
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<PenteGame::Move> moves;
    moves.reserve(std::min(static_cast<int>(scored.size()), width));
    for (const auto& [score, move] : scored) {
        if (static_cast<int>(moves.size()) >= width) break;
        moves.push_back(move);
    }
    return moves;
}

// ============================================================================
// Helpers
// ============================================================================

bool Search::decidedScore(const PenteGame& game, Score& score) const {
    PenteGame::Player winner = game.getWinner();
    if (winner == config_.player) {
        score = WIN_SCORE;
        return true;
    }
    if (winner == opponent_) {
        score = -WIN_SCORE;
        return true;
    }
    return false;
}

bool Search::outOfTime() const {
    if (config_.timeLimitMs <= 0) {
        return false;
    }
    auto elapsed = std::chrono::steady_clock::now() - searchStart_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= config_.timeLimitMs;
}

void Search::printStats() const {
    std::cout << "\n=== Search Statistics ===\n";
    std::cout << "Mode: " << algorithmName(config_.algorithm) << " + " << heuristicName(config_.heuristic)
              << ", depth " << config_.depth << "\n";
    std::cout << "Nodes explored: " << GameUtils::formatWithCommas(nodesExplored_)
              << ". Pruned branches: " << GameUtils::formatWithCommas(prunedBranches_) << "\n";
    std::cout << "Search time: " << std::fixed << std::setprecision(3) << lastSearchSeconds_ << " sec\n";

    if (bestMove_.isValid()) {
        std::cout << "Best move: " << GameUtils::displayMove(bestMove_.row, bestMove_.col)
                  << (forcedMove_ ? " (forced)" : "") << ", score " << lastScore_ << "\n";
    } else {
        std::cout << "Best move: none (no candidates)\n";
    }
    std::cout << "=========================\n\n";
}

const char* algorithmName(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::MINIMAX: return "Minimax";
        case Algorithm::ALPHA_BETA: return "Alpha-Beta";
    }
    return "Unknown";
}

const char* heuristicName(Heuristic heuristic) {
    switch (heuristic) {
        case Heuristic::H1: return "H1";
        case Heuristic::H2: return "H2";
    }
    return "Unknown";
}

bool parseMode(const std::string& tag, Algorithm& algorithm, Heuristic& heuristic) {
    std::string lower(tag);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto sep = lower.find('_');
    if (sep == std::string::npos) {
        return false;
    }
    std::string algo = lower.substr(0, sep);
    std::string heur = lower.substr(sep + 1);

    Algorithm parsedAlgorithm;
    if (algo == "minimax") {
        parsedAlgorithm = Algorithm::MINIMAX;
    } else if (algo == "alphabeta") {
        parsedAlgorithm = Algorithm::ALPHA_BETA;
    } else {
        return false;
    }

    Heuristic parsedHeuristic;
    if (heur == "h1") {
        parsedHeuristic = Heuristic::H1;
    } else if (heur == "h2") {
        parsedHeuristic = Heuristic::H2;
    } else {
        return false;
    }

    algorithm = parsedAlgorithm;
    heuristic = parsedHeuristic;
    return true;
}

} // namespace pente
