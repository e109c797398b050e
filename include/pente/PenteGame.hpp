#ifndef PENTE_PENTEGAME_HPP
#define PENTE_PENTEGAME_HPP

#include "pente/BitBoard.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace pente {

// Board engine: grid, move counter, capture ledger and win state.
// Moves are applied and reverted in place; the search relies on undoMove()
// restoring every piece of state that makeMove() touched.
class PenteGame {
public:
    static constexpr int BOARD_SIZE = BitBoard::SIZE;
    static constexpr int CENTER = BOARD_SIZE / 2;
    static constexpr int WIN_LENGTH = 5;
    // 8 directions, one flanked pair each
    static constexpr int MAX_CAPTURED_STONES = 16;

    enum Player {
        NONE = 0,
        BLACK = 1,  // moves first
        WHITE = 2
    };

    static Player opponent(Player player) {
        if (player == BLACK) return WHITE;
        if (player == WHITE) return BLACK;
        return NONE;
    }

    struct Move {
        int row, col;
        Move() : row(-1), col(-1) {}
        Move(int row, int col) : row(row), col(col) {}
        bool isValid() const { return row >= 0 && col >= 0; }
        bool operator==(const Move& other) const { return row == other.row && col == other.col; }
        bool operator!=(const Move& other) const { return !(*this == other); }
    };

    struct Config {
        // Center opening and a restricted second stone for the first player
        bool tournamentRule = false;
        // Captured pairs needed to win outright
        int capturesToWin = 5;

        static Config standard() { return Config(); }
        static Config tournament() {
            Config config;
            config.tournamentRule = true;
            return config;
        }
    };

    struct CaptureRecord {
        Player player;    // who captured
        Player opponent;  // whose stones were removed
        int pairCount = 0;
        std::array<Move, MAX_CAPTURED_STONES> stones;

        int stoneCount() const { return pairCount * 2; }
    };

    // One entry per applied move. capture is empty when nothing was taken.
    struct MoveRecord {
        Move move;
        Player player;
        std::optional<CaptureRecord> capture;
    };

private:
    Config config;
    BitBoard blackStones;
    BitBoard whiteStones;
    int blackCaptures;
    int whiteCaptures;
    int moveCount;
    Player winner;
    std::vector<Move> winningSequence;
    std::vector<MoveRecord> moveHistory;

    BitBoard& stonesOf(Player player) { return player == BLACK ? blackStones : whiteStones; }
    const BitBoard& stonesOf(Player player) const { return player == BLACK ? blackStones : whiteStones; }
    int& capturesOf(Player player) { return player == BLACK ? blackCaptures : whiteCaptures; }

    std::optional<CaptureRecord> checkAndCapture(int row, int col, Player player);
    void updateWinner(Player player);
    bool violatesTournamentRule(int row, int col) const;

public:
    PenteGame();
    explicit PenteGame(const Config& config);

    // Core game functions
    void reset();
    bool makeMove(int row, int col, Player player);  // Returns false if illegal
    bool makeMove(int row, int col);                 // Plays for the side to move
    bool makeMove(const char* move);                 // Notation like "K10"
    void undoMove();                                 // Reverts the last applied move

    // Game state queries
    Player getCurrentPlayer() const { return moveCount % 2 == 0 ? BLACK : WHITE; }
    Player getWinner() const { return winner; }
    const std::vector<Move>& getWinningSequence() const { return winningSequence; }
    bool isGameOver() const { return winner != NONE; }
    bool isLegalMove(int row, int col) const;
    bool isFull() const;

    // Empty cells within Chebyshev radius of any stone, row-major order.
    // The center cell alone on an empty board.
    std::vector<Move> getCandidateMoves(int radius = 2) const;

    // State access
    int getCaptures(Player player) const;
    int getBlackCaptures() const { return blackCaptures; }
    int getWhiteCaptures() const { return whiteCaptures; }
    int getMoveCount() const { return moveCount; }
    int getStoneCount() const { return (blackStones | whiteStones).count(); }
    Move getLastMove() const {
        return moveHistory.empty() ? Move() : moveHistory.back().move;
    }
    std::size_t getHistoryDepth() const { return moveHistory.size(); }
    const std::vector<MoveRecord>& getHistory() const { return moveHistory; }
    const Config& getConfig() const { return config; }

    Player getStoneAt(int row, int col) const;
    const BitBoard& getStones(Player player) const { return stonesOf(player); }
};

} // namespace pente

#endif // PENTE_PENTEGAME_HPP
