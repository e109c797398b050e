#include "pente/Evaluator.hpp"
#include "pente/Profiler.hpp"
#include <cstdlib>

namespace pente {

namespace {

const int LINE_DIRS[4][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1}};

} // namespace

// ============================================================================
// Pattern scanner
// ============================================================================

Score Evaluator::runValue(int length, int openEnds) {
    if (length >= PenteGame::WIN_LENGTH) return Patterns::FIVE;

    // Only two open ends count as open; a run closed on both sides keeps the closed value
    switch (length) {
        case 4: return openEnds == 2 ? Patterns::OPEN_FOUR : Patterns::FOUR;
        case 3: return openEnds == 2 ? Patterns::OPEN_THREE : Patterns::THREE;
        case 2: return openEnds == 2 ? Patterns::OPEN_TWO : Patterns::TWO;
        default: return 0;
    }
}

Evaluator::PatternTotals Evaluator::scanPatterns(const PenteGame& game, PenteGame::Player player) {
    PENTE_PROFILE_SCOPE("Evaluator::scanPatterns");
    PatternTotals totals;

    for (PenteGame::Player color : {PenteGame::BLACK, PenteGame::WHITE}) {
        const BitBoard& stones = game.getStones(color);
        Score& total = (color == player) ? totals.own : totals.opponent;

        stones.forEachSet([&](int row, int col) {
            for (const auto& dir : LINE_DIRS) {
                int pr = row - dir[0];
                int pc = col - dir[1];

                // Only the first stone of a run scores it
                if (stones.getBit(pr, pc)) {
                    continue;
                }

                int length = 1;
                while (length < PenteGame::WIN_LENGTH &&
                       stones.getBit(row + dir[0] * length, col + dir[1] * length)) {
                    length++;
                }

                int er = row + dir[0] * length;
                int ec = col + dir[1] * length;

                int openEnds = 0;
                if (BitBoard::inBounds(pr, pc) && game.getStoneAt(pr, pc) == PenteGame::NONE) openEnds++;
                if (BitBoard::inBounds(er, ec) && game.getStoneAt(er, ec) == PenteGame::NONE) openEnds++;

                total += runValue(length, openEnds);
            }
        });
    }

    return totals;
}

// ============================================================================
// AggressiveEvaluator (H1)
// ============================================================================

Score AggressiveEvaluator::evaluate(const PenteGame& game, PenteGame::Player player) const {
    PENTE_PROFILE_SCOPE("AggressiveEvaluator::evaluate");
    PenteGame::Player opp = PenteGame::opponent(player);

    Score score = (game.getCaptures(player) - game.getCaptures(opp)) * CAPTURE_WEIGHT;

    PatternTotals patterns = scanPatterns(game, player);
    score += patterns.own - patterns.opponent / 2;
    return score;
}

// ============================================================================
// StrategicEvaluator (H2)
// ============================================================================

Score StrategicEvaluator::evaluate(const PenteGame& game, PenteGame::Player player) const {
    PENTE_PROFILE_SCOPE("StrategicEvaluator::evaluate");
    PenteGame::Player opp = PenteGame::opponent(player);

    PenteGame::Player winner = game.getWinner();
    if (winner == player) return DECIDED;
    if (winner == opp) return -DECIDED;

    Score score = (game.getCaptures(player) - game.getCaptures(opp)) * CAPTURE_WEIGHT;

    // Centre control, Manhattan distance
    game.getStones(player).forEachSet([&score](int row, int col) {
        int distance = std::abs(row - PenteGame::CENTER) + std::abs(col - PenteGame::CENTER);
        score += CENTRALITY_BASE - distance;
    });

    PatternTotals patterns = scanPatterns(game, player);
    score += patterns.own - patterns.opponent * 3 / 2;
    return score;
}

std::unique_ptr<Evaluator> makeEvaluator(Heuristic heuristic) {
    switch (heuristic) {
        case Heuristic::H1: return std::make_unique<AggressiveEvaluator>();
        case Heuristic::H2: return std::make_unique<StrategicEvaluator>();
    }
    return std::make_unique<StrategicEvaluator>();
}

} // namespace pente
