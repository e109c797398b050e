#ifndef PENTE_EVALUATOR_HPP
#define PENTE_EVALUATOR_HPP

#include "pente/PenteGame.hpp"
#include <cstdint>
#include <memory>

namespace pente {

using Score = int64_t;

enum class Heuristic {
    H1,  // aggressive
    H2   // strategic
};

// Run values for the pattern scanner
namespace Patterns {
constexpr Score FIVE = 1000000;
constexpr Score OPEN_FOUR = 100000;
constexpr Score FOUR = 50000;
constexpr Score OPEN_THREE = 10000;
constexpr Score THREE = 1000;
constexpr Score OPEN_TWO = 500;
constexpr Score TWO = 10;
} // namespace Patterns

// Abstract interface for static position evaluation
class Evaluator {
public:
    virtual ~Evaluator() = default;

    // Signed score, higher favours player
    virtual Score evaluate(const PenteGame& game, PenteGame::Player player) const = 0;

    // Value of a contiguous run given how many of its ends touch an empty cell
    static Score runValue(int length, int openEnds);

    struct PatternTotals {
        Score own = 0;
        Score opponent = 0;
    };

    // Sums runValue over every run on the board, split by owner
    static PatternTotals scanPatterns(const PenteGame& game, PenteGame::Player player);
};

// H1: capture differential plus run patterns, own runs weigh more than the opponent's
class AggressiveEvaluator : public Evaluator {
public:
    static constexpr Score CAPTURE_WEIGHT = 10000;

    Score evaluate(const PenteGame& game, PenteGame::Player player) const override;
};

// H2: decided games short-circuit, lighter captures, centrality, defensive patterns
class StrategicEvaluator : public Evaluator {
public:
    static constexpr Score DECIDED = 10000000;
    static constexpr Score CAPTURE_WEIGHT = 5000;
    static constexpr int CENTRALITY_BASE = 20;

    Score evaluate(const PenteGame& game, PenteGame::Player player) const override;
};

std::unique_ptr<Evaluator> makeEvaluator(Heuristic heuristic);

} // namespace pente

#endif // PENTE_EVALUATOR_HPP
