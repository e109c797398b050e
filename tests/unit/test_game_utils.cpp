#include <gtest/gtest.h>
#include "pente/GameUtils.hpp"
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace pente;

TEST(GameUtilsTest, ParseMoveCorners) {
    EXPECT_EQ(GameUtils::parseMove("A1"), std::make_pair(0, 0));
    EXPECT_EQ(GameUtils::parseMove("T19"), std::make_pair(18, 18));
    EXPECT_EQ(GameUtils::parseMove("K10"), std::make_pair(9, 9));
}

TEST(GameUtilsTest, ParseMoveSkipsLetterI) {
    EXPECT_EQ(GameUtils::parseMove("H5"), std::make_pair(4, 7));
    EXPECT_EQ(GameUtils::parseMove("J5"), std::make_pair(4, 8));
    EXPECT_EQ(GameUtils::parseMove("k10"), std::make_pair(9, 9));
}

TEST(GameUtilsTest, ParseMoveRejectsMalformedInput) {
    const std::pair<int, int> invalid(-1, -1);
    for (const char* move : {"I5", "Z1", "K0", "K20", "K", "", "10", "K1a", "-K5"}) {
        EXPECT_EQ(GameUtils::parseMove(move), invalid) << "input '" << move << "'";
    }
    EXPECT_EQ(GameUtils::parseMove(nullptr), invalid);
}

TEST(GameUtilsTest, DisplayMoveRoundTrip) {
    EXPECT_EQ(GameUtils::displayMove(0, 0), "A1");
    EXPECT_EQ(GameUtils::displayMove(9, 9), "K10");
    EXPECT_EQ(GameUtils::displayMove(4, 8), "J5");
    EXPECT_EQ(GameUtils::displayMove(18, 18), "T19");
    EXPECT_EQ(GameUtils::displayMove(-1, -1), "--");

    for (int col = 0; col < PenteGame::BOARD_SIZE; col++) {
        std::string text = GameUtils::displayMove(3, col);
        EXPECT_EQ(GameUtils::parseMove(text.c_str()), std::make_pair(3, col)) << text;
    }
}

TEST(GameUtilsTest, ParseGameStringDropsMoveNumbers) {
    auto moves = GameUtils::parseGameString("1. K10 L9 2. K6 M10 3. K12");

    EXPECT_EQ(moves, (std::vector<std::string>{"K10", "L9", "K6", "M10", "K12"}));
    EXPECT_TRUE(GameUtils::parseGameString("").empty());
    EXPECT_TRUE(GameUtils::parseGameString(nullptr).empty());
}

TEST(GameUtilsTest, ParseGameStringReplaysOntoBoard) {
    PenteGame game;
    for (const auto& move : GameUtils::parseGameString("K10 L10 K11 L11")) {
        ASSERT_TRUE(game.makeMove(move.c_str()));
    }

    EXPECT_EQ(game.getStoneAt(9, 9), PenteGame::BLACK);
    EXPECT_EQ(game.getStoneAt(10, 10), PenteGame::WHITE);
    EXPECT_EQ(game.getMoveCount(), 4);
}

TEST(GameUtilsTest, FormatWithCommas) {
    EXPECT_EQ(GameUtils::formatWithCommas(0), "0");
    EXPECT_EQ(GameUtils::formatWithCommas(999), "999");
    EXPECT_EQ(GameUtils::formatWithCommas(1000), "1,000");
    EXPECT_EQ(GameUtils::formatWithCommas(1234567), "1,234,567");
    EXPECT_EQ(GameUtils::formatWithCommas(-45000), "-45,000");
    EXPECT_EQ(GameUtils::formatWithCommas(std::numeric_limits<long long>::min()),
              "-9,223,372,036,854,775,808");
    EXPECT_EQ(GameUtils::formatWithCommas(std::numeric_limits<long long>::max()),
              "9,223,372,036,854,775,807");
}
