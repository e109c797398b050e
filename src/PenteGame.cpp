#include "pente/PenteGame.hpp"
#include "pente/GameUtils.hpp"
#include "pente/Profiler.hpp"
#include <algorithm>
#include <cstdlib>

namespace pente {

namespace {

// Capture directions: each axis in both signs
const int CAPTURE_DIRS[8][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1},
                                {0, -1}, {-1, 0}, {-1, -1}, {-1, 1}};

// Line directions for five-in-a-row, walked forward only
const int LINE_DIRS[4][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1}};

int distanceFromCenter(int row, int col) {
    return std::max(std::abs(row - PenteGame::CENTER), std::abs(col - PenteGame::CENTER));
}

} // namespace

PenteGame::PenteGame() : PenteGame(Config::standard()) {}

PenteGame::PenteGame(const Config& config) : config(config) {
    reset();
}

void PenteGame::reset() {
    blackStones.clear();
    whiteStones.clear();
    blackCaptures = 0;
    whiteCaptures = 0;
    moveCount = 0;
    winner = NONE;
    winningSequence.clear();
    moveHistory.clear();
    moveHistory.reserve(BOARD_SIZE * BOARD_SIZE);
}

bool PenteGame::makeMove(const char* move) {
    auto [row, col] = GameUtils::parseMove(move);
    return makeMove(row, col);
}

bool PenteGame::makeMove(int row, int col) {
    return makeMove(row, col, getCurrentPlayer());
}

bool PenteGame::makeMove(int row, int col, Player player) {
    PENTE_PROFILE_SCOPE("PenteGame::makeMove");
    if (player == NONE || !isLegalMove(row, col)) {
        return false;
    }

    stonesOf(player).setBit(row, col);
    moveCount++;

    MoveRecord record;
    record.move = Move(row, col);
    record.player = player;
    record.capture = checkAndCapture(row, col, player);
    moveHistory.push_back(record);

    updateWinner(player);
    return true;
}

void PenteGame::undoMove() {
    PENTE_PROFILE_SCOPE("PenteGame::undoMove");
    if (moveHistory.empty()) {
        return;
    }

    const MoveRecord& last = moveHistory.back();

    stonesOf(last.player).clearBit(last.move.row, last.move.col);
    moveCount--;

    // Win state is never carried across an undo; the next apply recomputes it
    winner = NONE;
    winningSequence.clear();

    if (last.capture) {
        const CaptureRecord& capture = *last.capture;
        BitBoard& oppStones = stonesOf(capture.opponent);
        for (int i = 0; i < capture.stoneCount(); i++) {
            oppStones.setBit(capture.stones[i].row, capture.stones[i].col);
        }
        capturesOf(capture.player) -= capture.pairCount;
    }

    moveHistory.pop_back();
}

std::optional<PenteGame::CaptureRecord> PenteGame::checkAndCapture(int row, int col, Player player) {
    BitBoard& myStones = stonesOf(player);
    BitBoard& oppStones = stonesOf(opponent(player));

    CaptureRecord capture;
    capture.player = player;
    capture.opponent = opponent(player);

    for (const auto& dir : CAPTURE_DIRS) {
        int dr = dir[0];
        int dc = dir[1];

        // X O O X, with the new stone as the first X
        int r3 = row + dr * 3;
        int c3 = col + dc * 3;
        if (!BitBoard::inBounds(r3, c3)) {
            continue;
        }

        int r1 = row + dr, c1 = col + dc;
        int r2 = row + dr * 2, c2 = col + dc * 2;
        if (oppStones.getBit(r1, c1) && oppStones.getBit(r2, c2) && myStones.getBit(r3, c3)) {
            oppStones.clearBit(r1, c1);
            oppStones.clearBit(r2, c2);

            int n = capture.stoneCount();
            capture.stones[n] = Move(r1, c1);
            capture.stones[n + 1] = Move(r2, c2);
            capture.pairCount++;
        }
    }

    if (capture.pairCount == 0) {
        return std::nullopt;
    }

    capturesOf(player) += capture.pairCount;
    return capture;
}

void PenteGame::updateWinner(Player player) {
    PENTE_PROFILE_SCOPE("PenteGame::updateWinner");
    if (getCaptures(player) >= config.capturesToWin) {
        winner = player;
        winningSequence.clear();
        return;
    }

    // Full rescan of the mover's stones; the first run of five found wins
    const BitBoard& stones = stonesOf(player);
    stones.findSet([&](int row, int col) {
        for (const auto& dir : LINE_DIRS) {
            int length = 1;
            while (length < WIN_LENGTH &&
                   stones.getBit(row + dir[0] * length, col + dir[1] * length)) {
                length++;
            }

            if (length == WIN_LENGTH) {
                winner = player;
                winningSequence.clear();
                for (int i = 0; i < WIN_LENGTH; i++) {
                    winningSequence.emplace_back(row + dir[0] * i, col + dir[1] * i);
                }
                return true;
            }
        }
        return false;
    });
}

bool PenteGame::violatesTournamentRule(int row, int col) const {
    if (!config.tournamentRule) {
        return false;
    }

    // First stone on the center
    if (moveCount == 0) {
        return row != CENTER || col != CENTER;
    }

    // First player's second stone at least 3 away from the center
    if (moveCount == 2) {
        return distanceFromCenter(row, col) < 3;
    }

    return false;
}

bool PenteGame::isLegalMove(int row, int col) const {
    if (!BitBoard::inBounds(row, col)) {
        return false;
    }

    if (blackStones.getBit(row, col) || whiteStones.getBit(row, col)) {
        return false;
    }

    return !violatesTournamentRule(row, col);
}

bool PenteGame::isFull() const {
    return getStoneCount() == BitBoard::CELLS;
}

std::vector<PenteGame::Move> PenteGame::getCandidateMoves(int radius) const {
    PENTE_PROFILE_SCOPE("PenteGame::getCandidateMoves");
    std::vector<Move> moves;

    BitBoard occupied = blackStones | whiteStones;
    if (!occupied.any()) {
        moves.emplace_back(CENTER, CENTER);
        return moves;
    }

    // Mark every empty cell in the neighbourhood of a stone
    BitBoard near;
    occupied.forEachSet([&](int row, int col) {
        for (int dr = -radius; dr <= radius; dr++) {
            for (int dc = -radius; dc <= radius; dc++) {
                int nr = row + dr;
                int nc = col + dc;
                if (BitBoard::inBounds(nr, nc) && !occupied.getBit(nr, nc)) {
                    near.setBit(nr, nc);
                }
            }
        }
    });

    moves = near.getSetPositions<Move>();

    if (config.tournamentRule && moveCount == 2) {
        moves.erase(std::remove_if(moves.begin(), moves.end(),
                                   [](const Move& m) {
                                       return distanceFromCenter(m.row, m.col) < 3;
                                   }),
                    moves.end());

        // Nothing nearby is far enough out; fall back to the ring at distance 3
        if (moves.empty()) {
            for (int row = CENTER - 3; row <= CENTER + 3; row++) {
                for (int col = CENTER - 3; col <= CENTER + 3; col++) {
                    if (distanceFromCenter(row, col) == 3 && !occupied.getBit(row, col)) {
                        moves.emplace_back(row, col);
                    }
                }
            }
        }
    }

    return moves;
}

int PenteGame::getCaptures(Player player) const {
    if (player == BLACK) return blackCaptures;
    if (player == WHITE) return whiteCaptures;
    return 0;
}

PenteGame::Player PenteGame::getStoneAt(int row, int col) const {
    if (blackStones.getBit(row, col)) return BLACK;
    if (whiteStones.getBit(row, col)) return WHITE;
    return NONE;
}

} // namespace pente
