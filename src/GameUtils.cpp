#include "pente/GameUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

namespace pente {

namespace {

char columnChar(int col) {
    char c = static_cast<char>('A' + col);
    return (c >= 'I') ? static_cast<char>(c + 1) : c;  // Skip 'I'
}

} // namespace

std::pair<int, int> GameUtils::parseMove(const char* move) {
    if (move == nullptr || std::strlen(move) < 2) {
        return {-1, -1};
    }

    char colChar = static_cast<char>(std::toupper(static_cast<unsigned char>(move[0])));
    if (colChar < 'A' || colChar > 'T' || colChar == 'I') {
        return {-1, -1};
    }
    if (colChar > 'I') {
        colChar--;
    }
    int col = colChar - 'A';

    for (const char* p = move + 1; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) {
            return {-1, -1};
        }
    }
    int row = std::atoi(move + 1) - 1;
    if (row < 0 || row >= PenteGame::BOARD_SIZE) {
        return {-1, -1};
    }

    return {row, col};
}

std::string GameUtils::displayMove(int row, int col) {
    if (row < 0 || col < 0) {
        return "--";
    }
    return std::string(1, columnChar(col)) + std::to_string(row + 1);
}

std::vector<std::string> GameUtils::parseGameString(const char* gameStr) {
    std::vector<std::string> moves;
    if (gameStr == nullptr) {
        return moves;
    }

    std::istringstream in(gameStr);
    std::string token;
    while (in >> token) {
        // Skip move numbers: "1.", "2.", ...
        if (!token.empty() && token.back() == '.') {
            continue;
        }
        moves.push_back(token);
    }
    return moves;
}

void GameUtils::printBoard(const PenteGame& game) {
    const std::vector<PenteGame::Move>& winning = game.getWinningSequence();
    const PenteGame::Move last = game.getLastMove();

    std::cout << "   ";
    for (int col = 0; col < PenteGame::BOARD_SIZE; col++) {
        std::cout << columnChar(col) << " ";
    }
    std::cout << "\n";

    for (int row = PenteGame::BOARD_SIZE - 1; row >= 0; row--) {
        std::cout << (row < 9 ? " " : "") << (row + 1) << " ";
        for (int col = 0; col < PenteGame::BOARD_SIZE; col++) {
            PenteGame::Player stone = game.getStoneAt(row, col);
            bool highlight = std::find(winning.begin(), winning.end(), PenteGame::Move(row, col)) != winning.end()
                             || last == PenteGame::Move(row, col);
            if (stone == PenteGame::BLACK) {
                std::cout << (highlight ? "◉ " : "○ ");
            } else if (stone == PenteGame::WHITE) {
                std::cout << (highlight ? "◈ " : "● ");
            } else {
                std::cout << "· ";
            }
        }
        std::cout << (row + 1) << "\n";
    }

    std::cout << "   ";
    for (int col = 0; col < PenteGame::BOARD_SIZE; col++) {
        std::cout << columnChar(col) << " ";
    }
    std::cout << "\n";
}

void GameUtils::printGameState(const PenteGame& game) {
    printBoard(game);

    int capturesToWin = game.getConfig().capturesToWin;
    std::cout << "Captured pairs: " << game.getBlackCaptures() << "/" << capturesToWin << " Black ○, "
              << game.getWhiteCaptures() << "/" << capturesToWin << " White ●. ";

    PenteGame::Player winner = game.getWinner();
    if (winner != PenteGame::NONE) {
        std::cout << "Winner: " << (winner == PenteGame::BLACK ? "Black" : "White") << "\n";
    } else {
        std::cout << "Current player: "
                  << (game.getCurrentPlayer() == PenteGame::BLACK ? "Black" : "White") << "\n";
    }
}

std::string GameUtils::formatWithCommas(long long value) {
    // Magnitude in unsigned arithmetic so LLONG_MIN has no overflow
    unsigned long long magnitude = value < 0 ? 0ULL - static_cast<unsigned long long>(value)
                                             : static_cast<unsigned long long>(value);
    std::string num = std::to_string(magnitude);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

} // namespace pente
