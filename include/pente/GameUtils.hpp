#ifndef PENTE_GAMEUTILS_HPP
#define PENTE_GAMEUTILS_HPP

#include "pente/PenteGame.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pente {

class GameUtils {
public:
    // Move parsing/display. Columns A-T skipping I, rows 1-19.
    // parseMove returns {row, col}, or {-1, -1} for malformed input.
    static std::pair<int, int> parseMove(const char* move);
    static std::string displayMove(int row, int col);

    // Move strings from "1. K10 L9 2. K6 ..." (move numbers are dropped)
    static std::vector<std::string> parseGameString(const char* gameStr);

    // Board printing
    static void printBoard(const PenteGame& game);
    static void printGameState(const PenteGame& game);

    // Number formatting
    static std::string formatWithCommas(long long value);
};

} // namespace pente

#endif // PENTE_GAMEUTILS_HPP
