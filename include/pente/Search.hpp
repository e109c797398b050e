#ifndef PENTE_SEARCH_HPP
#define PENTE_SEARCH_HPP

#include "pente/Evaluator.hpp"
#include "pente/PenteGame.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pente {

enum class Algorithm {
    MINIMAX,
    ALPHA_BETA
};

// Fixed-depth adversarial search over a borrowed PenteGame.
// The game is mutated with makeMove/undoMove during getBestMove() and is
// back in its original state when the call returns. Not thread-safe: one
// game instance must never be searched by two threads at once.
class Search {
public:
    // Dominates any heuristic score
    static constexpr Score WIN_SCORE = 1000000000000LL;

    struct Config {
        Algorithm algorithm = Algorithm::ALPHA_BETA;
        Heuristic heuristic = Heuristic::H2;
        int depth = 2;
        PenteGame::Player player = PenteGame::WHITE;

        // Candidate radius and truncation widths, root and interior nodes
        int minimaxRadius = 1;
        int minimaxRootWidth = 8;
        int minimaxNodeWidth = 5;
        int alphaBetaRadius = 2;
        int alphaBetaRootWidth = 15;
        int alphaBetaNodeWidth = 10;

        int timeLimitMs = 0;   // Soft budget checked between root moves, 0 = none
        bool verbose = false;  // Print a summary after each search

        // Throws std::invalid_argument on out-of-range values
        void validate() const;
    };

    Search();
    explicit Search(const Config& config);

    // Main search interface. Returns an invalid Move when nothing can be played.
    PenteGame::Move getBestMove(PenteGame& game);

    // Configuration
    void setConfig(const Config& config);
    const Config& getConfig() const { return config_; }

    // Statistics from the last getBestMove()
    long getNodesExplored() const { return nodesExplored_; }
    long getPrunedBranches() const { return prunedBranches_; }
    Score getLastScore() const { return lastScore_; }
    double getLastSearchSeconds() const { return lastSearchSeconds_; }
    bool wasForcedMove() const { return forcedMove_; }
    void printStats() const;

private:
    using RootSearch = PenteGame::Move (Search::*)(PenteGame&);

    // One-ply scan for a move that wins now, then for a cell the opponent would win on
    PenteGame::Move findForcedMove(PenteGame& game);

    PenteGame::Move minimaxRoot(PenteGame& game);
    Score minimax(PenteGame& game, int depth, bool maximizing);

    PenteGame::Move alphaBetaRoot(PenteGame& game);
    Score alphaBeta(PenteGame& game, int depth, Score alpha, Score beta, bool maximizing);

    // Root replies: candidates sorted by distance to the opponent's last move, cut to width
    std::vector<PenteGame::Move> proximityOrdered(const PenteGame& game, int radius, int width) const;
    // Interior nodes: candidates sorted by stones in their 3x3 neighbourhood, cut to width
    std::vector<PenteGame::Move> densityOrdered(const PenteGame& game, int radius, int width) const;
    // Candidates sorted by one-ply heuristic score for the searching player, cut to width
    std::vector<PenteGame::Move> scoreOrdered(PenteGame& game, int radius, int width) const;

    // +/-WIN_SCORE when the game at this node is already decided
    bool decidedScore(const PenteGame& game, Score& score) const;
    bool outOfTime() const;

    // Member variables
    Config config_;
    PenteGame::Player opponent_;
    std::unique_ptr<Evaluator> evaluator_;
    RootSearch rootSearch_ = nullptr;

    // Statistics
    long nodesExplored_ = 0;
    long prunedBranches_ = 0;
    Score lastScore_ = 0;
    PenteGame::Move bestMove_;
    double lastSearchSeconds_ = 0.0;
    bool forcedMove_ = false;
    std::chrono::steady_clock::time_point searchStart_;
};

const char* algorithmName(Algorithm algorithm);
const char* heuristicName(Heuristic heuristic);

// Mode tags: "minimax_h1", "minimax_h2", "alphabeta_h1", "alphabeta_h2" (any case).
// Outputs are left untouched when the tag is not recognised.
bool parseMode(const std::string& tag, Algorithm& algorithm, Heuristic& heuristic);

} // namespace pente

#endif // PENTE_SEARCH_HPP
