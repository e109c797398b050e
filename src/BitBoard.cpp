#include "pente/BitBoard.hpp"
#include <cstring>  // for memset and memcmp

namespace pente {

BitBoard::BitBoard() {
    std::memset(board, 0, sizeof(board));
}

void BitBoard::setBit(int row, int col) {
    if (!inBounds(row, col)) {
        return;
    }

    int index = toIndex(row, col);
    board[index / BITS_PER_UINT64] |= (1ULL << (index % BITS_PER_UINT64));
}

void BitBoard::clearBit(int row, int col) {
    if (!inBounds(row, col)) {
        return;
    }

    int index = toIndex(row, col);
    board[index / BITS_PER_UINT64] &= ~(1ULL << (index % BITS_PER_UINT64));
}

bool BitBoard::getBit(int row, int col) const {
    if (!inBounds(row, col)) {
        return false;
    }

    int index = toIndex(row, col);
    return (board[index / BITS_PER_UINT64] >> (index % BITS_PER_UINT64)) & 1;
}

void BitBoard::clear() {
    std::memset(board, 0, sizeof(board));
}

bool BitBoard::any() const {
    for (int i = 0; i < NUM_SEGMENTS; i++) {
        if (board[i]) return true;
    }
    return false;
}

int BitBoard::count() const {
    int total = 0;
    for (int i = 0; i < NUM_SEGMENTS; i++) {
        total += __builtin_popcountll(board[i]);
    }
    return total;
}

BitBoard BitBoard::operator|(const BitBoard& other) const {
    BitBoard result;
    for (int i = 0; i < NUM_SEGMENTS; i++) {
        result.board[i] = board[i] | other.board[i];
    }
    return result;
}

bool BitBoard::operator==(const BitBoard& other) const {
    return std::memcmp(board, other.board, sizeof(board)) == 0;
}

} // namespace pente
