#include <gtest/gtest.h>
#include "pente/PenteGame.hpp"
#include "pente/Search.hpp"
#include <stdexcept>
#include <tuple>
#include <vector>

using namespace pente;

namespace {

Search::Config makeConfig(Algorithm algorithm, Heuristic heuristic, int depth, PenteGame::Player player) {
    Search::Config config;
    config.algorithm = algorithm;
    config.heuristic = heuristic;
    config.depth = depth;
    config.player = player;
    return config;
}

// Board filled so that no line holds five of a colour and no X O O X exists
PenteGame::Player fillColor(int row, int col) {
    return (row + 2 * col) % 5 == 0 ? PenteGame::BLACK : PenteGame::WHITE;
}

} // namespace

class SearchModesTest : public ::testing::TestWithParam<std::tuple<Algorithm, Heuristic, int>> {
protected:
    Search::Config configFor(PenteGame::Player player) const {
        return makeConfig(std::get<0>(GetParam()), std::get<1>(GetParam()), std::get<2>(GetParam()), player);
    }
};

TEST_P(SearchModesTest, TakesImmediateWin) {
    PenteGame game;
    // White four, open at both ends; Black has a four of its own
    for (int col = 5; col < 9; col++) {
        game.makeMove(9, col, PenteGame::WHITE);
        game.makeMove(13, col, PenteGame::BLACK);
    }

    Search search(configFor(PenteGame::WHITE));
    PenteGame::Move move = search.getBestMove(game);

    EXPECT_TRUE(move == PenteGame::Move(9, 4) || move == PenteGame::Move(9, 9))
        << "got (" << move.row << "," << move.col << ")";
    EXPECT_TRUE(search.wasForcedMove());
    EXPECT_EQ(search.getLastScore(), Search::WIN_SCORE);
}

TEST_P(SearchModesTest, BlocksFiveInARow) {
    PenteGame game;
    game.makeMove(12, 4, PenteGame::WHITE);
    for (int col = 5; col < 9; col++) {
        game.makeMove(12, col, PenteGame::BLACK);
    }
    game.makeMove(6, 6, PenteGame::WHITE);

    Search search(configFor(PenteGame::WHITE));
    PenteGame::Move move = search.getBestMove(game);

    EXPECT_EQ(move, PenteGame::Move(12, 9));
    EXPECT_TRUE(search.wasForcedMove());
}

TEST_P(SearchModesTest, BlocksCaptureWin) {
    PenteGame::Config rules;
    rules.capturesToWin = 1;
    PenteGame game(rules);
    game.makeMove(5, 5, PenteGame::BLACK);
    game.makeMove(5, 6, PenteGame::WHITE);
    game.makeMove(5, 7, PenteGame::WHITE);

    Search search(configFor(PenteGame::WHITE));
    PenteGame::Move move = search.getBestMove(game);

    EXPECT_EQ(move, PenteGame::Move(5, 8));
}

TEST_P(SearchModesTest, LeavesBoardUntouched) {
    PenteGame game;
    for (const char* move : {"K10", "L10", "K11", "J9", "L12", "M10", "K12"}) {
        ASSERT_TRUE(game.makeMove(move));
    }
    PenteGame before = game;

    Search search(configFor(game.getCurrentPlayer()));
    PenteGame::Move move = search.getBestMove(game);

    EXPECT_TRUE(move.isValid());
    EXPECT_TRUE(game.isLegalMove(move.row, move.col));
    EXPECT_EQ(game.getStones(PenteGame::BLACK), before.getStones(PenteGame::BLACK));
    EXPECT_EQ(game.getStones(PenteGame::WHITE), before.getStones(PenteGame::WHITE));
    EXPECT_EQ(game.getMoveCount(), before.getMoveCount());
    EXPECT_EQ(game.getHistoryDepth(), before.getHistoryDepth());
    EXPECT_EQ(game.getBlackCaptures(), before.getBlackCaptures());
    EXPECT_EQ(game.getWhiteCaptures(), before.getWhiteCaptures());
    EXPECT_EQ(game.getLastMove(), before.getLastMove());
    EXPECT_GT(search.getNodesExplored(), 0);
}

TEST_P(SearchModesTest, EmptyBoardPlaysCenter) {
    PenteGame game;
    Search search(configFor(PenteGame::BLACK));

    EXPECT_EQ(search.getBestMove(game), PenteGame::Move(9, 9));
}

TEST_P(SearchModesTest, FullBoardReturnsNoMove) {
    PenteGame game;
    for (int row = 0; row < PenteGame::BOARD_SIZE; row++) {
        for (int col = 0; col < PenteGame::BOARD_SIZE; col++) {
            ASSERT_TRUE(game.makeMove(row, col, fillColor(row, col)));
        }
    }
    ASSERT_TRUE(game.isFull());
    ASSERT_FALSE(game.isGameOver());

    Search search(configFor(PenteGame::BLACK));
    PenteGame::Move move = search.getBestMove(game);

    EXPECT_FALSE(move.isValid());
    EXPECT_EQ(game.getStoneCount(), PenteGame::BOARD_SIZE * PenteGame::BOARD_SIZE);
}

TEST_P(SearchModesTest, LastEmptyCellIsChosen) {
    PenteGame game;
    for (int row = 0; row < PenteGame::BOARD_SIZE; row++) {
        for (int col = 0; col < PenteGame::BOARD_SIZE; col++) {
            if (row == 18 && col == 18) continue;
            ASSERT_TRUE(game.makeMove(row, col, fillColor(row, col)));
        }
    }

    Search search(configFor(PenteGame::WHITE));
    EXPECT_EQ(search.getBestMove(game), PenteGame::Move(18, 18));
}

INSTANTIATE_TEST_SUITE_P(
    AllModes, SearchModesTest,
    ::testing::Combine(::testing::Values(Algorithm::MINIMAX, Algorithm::ALPHA_BETA),
                       ::testing::Values(Heuristic::H1, Heuristic::H2),
                       ::testing::Values(1, 2)));

// ============================================================================
// Minimax / alpha-beta agreement
// ============================================================================

class SearchAgreementTest : public ::testing::TestWithParam<std::tuple<Heuristic, int>> {};

TEST_P(SearchAgreementTest, AlphaBetaMatchesMinimaxWithFewerNodes) {
    PenteGame game;
    game.makeMove(9, 9, PenteGame::BLACK);
    game.makeMove(9, 10, PenteGame::WHITE);
    game.makeMove(10, 9, PenteGame::BLACK);
    game.makeMove(8, 8, PenteGame::WHITE);

    Heuristic heuristic = std::get<0>(GetParam());
    int depth = std::get<1>(GetParam());

    // Same candidate set everywhere, nothing truncated
    auto unbounded = [&](Algorithm algorithm) {
        Search::Config config = makeConfig(algorithm, heuristic, depth, PenteGame::BLACK);
        config.minimaxRadius = 1;
        config.alphaBetaRadius = 1;
        config.minimaxRootWidth = config.minimaxNodeWidth = 1000;
        config.alphaBetaRootWidth = config.alphaBetaNodeWidth = 1000;
        return config;
    };

    Search minimax(unbounded(Algorithm::MINIMAX));
    Search alphaBeta(unbounded(Algorithm::ALPHA_BETA));

    PenteGame::Move mmMove = minimax.getBestMove(game);
    PenteGame::Move abMove = alphaBeta.getBestMove(game);

    ASSERT_TRUE(mmMove.isValid());
    ASSERT_TRUE(abMove.isValid());
    EXPECT_FALSE(minimax.wasForcedMove());
    EXPECT_FALSE(alphaBeta.wasForcedMove());

    EXPECT_EQ(alphaBeta.getLastScore(), minimax.getLastScore());
    EXPECT_LE(alphaBeta.getNodesExplored(), minimax.getNodesExplored());
    EXPECT_EQ(minimax.getPrunedBranches(), 0);
    if (depth >= 2) {
        EXPECT_GT(alphaBeta.getPrunedBranches(), 0);
        EXPECT_LT(alphaBeta.getNodesExplored(), minimax.getNodesExplored());
    }
}

INSTANTIATE_TEST_SUITE_P(
    Depths, SearchAgreementTest,
    ::testing::Combine(::testing::Values(Heuristic::H1, Heuristic::H2), ::testing::Values(1, 2, 3)));

// ============================================================================
// Behaviour and configuration
// ============================================================================

TEST(SearchTest, PrefersCapture) {
    for (Algorithm algorithm : {Algorithm::MINIMAX, Algorithm::ALPHA_BETA}) {
        for (Heuristic heuristic : {Heuristic::H1, Heuristic::H2}) {
            PenteGame game;
            game.makeMove(5, 5, PenteGame::WHITE);
            game.makeMove(5, 6, PenteGame::BLACK);
            game.makeMove(5, 7, PenteGame::BLACK);

            Search search(makeConfig(algorithm, heuristic, 1, PenteGame::WHITE));
            EXPECT_EQ(search.getBestMove(game), PenteGame::Move(5, 8))
                << algorithmName(algorithm) << " + " << heuristicName(heuristic);
        }
    }
}

TEST(SearchTest, CountersResetBetweenCalls) {
    PenteGame game;
    game.makeMove(9, 9, PenteGame::BLACK);
    game.makeMove(9, 10, PenteGame::WHITE);

    Search search(makeConfig(Algorithm::ALPHA_BETA, Heuristic::H2, 2, PenteGame::BLACK));
    search.getBestMove(game);
    long firstNodes = search.getNodesExplored();
    long firstPruned = search.getPrunedBranches();

    search.getBestMove(game);
    EXPECT_EQ(search.getNodesExplored(), firstNodes);
    EXPECT_EQ(search.getPrunedBranches(), firstPruned);
}

TEST(SearchTest, ForcedMoveSkipsTreeSearch) {
    PenteGame game;
    for (int col = 5; col < 9; col++) {
        game.makeMove(9, col, PenteGame::BLACK);
    }

    Search search(makeConfig(Algorithm::MINIMAX, Heuristic::H1, 3, PenteGame::BLACK));
    search.getBestMove(game);

    EXPECT_TRUE(search.wasForcedMove());
    EXPECT_EQ(search.getNodesExplored(), 0);
}

TEST(SearchTest, SoftTimeLimitStillReturnsAMove) {
    PenteGame game;
    for (const char* move : {"K10", "L10", "K11", "J9", "L12", "M10"}) {
        game.makeMove(move);
    }

    Search::Config config = makeConfig(Algorithm::MINIMAX, Heuristic::H2, 3, PenteGame::BLACK);
    config.timeLimitMs = 1;
    Search search(config);

    PenteGame::Move move = search.getBestMove(game);
    EXPECT_TRUE(move.isValid());
    EXPECT_TRUE(game.isLegalMove(move.row, move.col));
}

TEST(SearchTest, RespectsTournamentRule) {
    PenteGame game(PenteGame::Config::tournament());
    game.makeMove(9, 9);
    game.makeMove(9, 10);

    Search search(makeConfig(Algorithm::ALPHA_BETA, Heuristic::H2, 2, PenteGame::BLACK));
    PenteGame::Move move = search.getBestMove(game);

    ASSERT_TRUE(move.isValid());
    EXPECT_TRUE(game.isLegalMove(move.row, move.col));
}

TEST(SearchTest, SetConfigSwitchesAlgorithm) {
    PenteGame game;
    game.makeMove(9, 9, PenteGame::BLACK);
    game.makeMove(9, 10, PenteGame::WHITE);

    Search search(makeConfig(Algorithm::MINIMAX, Heuristic::H1, 2, PenteGame::BLACK));
    search.getBestMove(game);
    EXPECT_EQ(search.getPrunedBranches(), 0);

    search.setConfig(makeConfig(Algorithm::ALPHA_BETA, Heuristic::H1, 2, PenteGame::BLACK));
    search.getBestMove(game);
    EXPECT_EQ(search.getConfig().algorithm, Algorithm::ALPHA_BETA);
    EXPECT_GT(search.getNodesExplored(), 0);
}

TEST(SearchConfigTest, RejectsInvalidValues) {
    Search::Config config;
    EXPECT_NO_THROW(config.validate());

    config.depth = 0;
    EXPECT_THROW(Search search(config), std::invalid_argument);

    config = Search::Config();
    config.player = PenteGame::NONE;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = Search::Config();
    config.alphaBetaRadius = 3;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = Search::Config();
    config.minimaxNodeWidth = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = Search::Config();
    config.timeLimitMs = -5;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(SearchConfigTest, RejectedConfigKeepsPreviousOne) {
    Search search(makeConfig(Algorithm::MINIMAX, Heuristic::H1, 2, PenteGame::BLACK));

    Search::Config bad = makeConfig(Algorithm::ALPHA_BETA, Heuristic::H2, 0, PenteGame::WHITE);
    EXPECT_THROW(search.setConfig(bad), std::invalid_argument);

    EXPECT_EQ(search.getConfig().algorithm, Algorithm::MINIMAX);
    EXPECT_EQ(search.getConfig().depth, 2);
}

TEST(SearchConfigTest, DefaultConstructorUsesDefaultConfig) {
    Search search;

    EXPECT_EQ(search.getConfig().algorithm, Algorithm::ALPHA_BETA);
    EXPECT_EQ(search.getConfig().heuristic, Heuristic::H2);
    EXPECT_EQ(search.getConfig().depth, 2);
    EXPECT_EQ(search.getConfig().player, PenteGame::WHITE);

    PenteGame game;
    EXPECT_EQ(search.getBestMove(game), PenteGame::Move(9, 9));
}

TEST(ParseModeTest, RecognisesAllTags) {
    Algorithm algorithm = Algorithm::MINIMAX;
    Heuristic heuristic = Heuristic::H1;

    ASSERT_TRUE(parseMode("alphabeta_h2", algorithm, heuristic));
    EXPECT_EQ(algorithm, Algorithm::ALPHA_BETA);
    EXPECT_EQ(heuristic, Heuristic::H2);

    ASSERT_TRUE(parseMode("MINIMAX_H1", algorithm, heuristic));
    EXPECT_EQ(algorithm, Algorithm::MINIMAX);
    EXPECT_EQ(heuristic, Heuristic::H1);
}

TEST(ParseModeTest, LeavesOutputsOnFailure) {
    Algorithm algorithm = Algorithm::ALPHA_BETA;
    Heuristic heuristic = Heuristic::H2;

    for (const char* tag : {"minimax", "mcts_h1", "alphabeta_h3", "", "minimax-h1"}) {
        EXPECT_FALSE(parseMode(tag, algorithm, heuristic)) << tag;
    }
    EXPECT_EQ(algorithm, Algorithm::ALPHA_BETA);
    EXPECT_EQ(heuristic, Heuristic::H2);
}
