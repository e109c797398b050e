#ifndef PENTE_BITBOARD_HPP
#define PENTE_BITBOARD_HPP

#include <cstdint>
#include <vector>

namespace pente {

// One bit per cell of the 19x19 board, indexed row-major.
class BitBoard {
public:
    static constexpr int SIZE = 19;
    static constexpr int CELLS = SIZE * SIZE;

private:
    static constexpr int BITS_PER_UINT64 = 64;
    static constexpr int NUM_SEGMENTS = (CELLS + BITS_PER_UINT64 - 1) / BITS_PER_UINT64;

    uint64_t board[NUM_SEGMENTS];

    static int toIndex(int row, int col) { return row * SIZE + col; }

public:
    BitBoard();

    static bool inBounds(int row, int col) {
        return row >= 0 && row < SIZE && col >= 0 && col < SIZE;
    }

    // Core operations, out-of-bounds coordinates are ignored / read as unset
    void setBit(int row, int col);
    void clearBit(int row, int col);
    bool getBit(int row, int col) const;
    void clear();

    bool any() const;
    int count() const;

    BitBoard operator|(const BitBoard& other) const;
    bool operator==(const BitBoard& other) const;
    bool operator!=(const BitBoard& other) const { return !(*this == other); }

    // Calls fn(row, col) for every set bit in row-major order
    template <typename Fn>
    void forEachSet(Fn&& fn) const {
        for (int s = 0; s < NUM_SEGMENTS; s++) {
            uint64_t bits = board[s];
            while (bits) {
                int index = s * BITS_PER_UINT64 + __builtin_ctzll(bits);
                fn(index / SIZE, index % SIZE);
                bits &= bits - 1;
            }
        }
    }

    // Visits set bits in row-major order until pred(row, col) returns true.
    // Returns whether any call returned true.
    template <typename Pred>
    bool findSet(Pred&& pred) const {
        for (int s = 0; s < NUM_SEGMENTS; s++) {
            uint64_t bits = board[s];
            while (bits) {
                int index = s * BITS_PER_UINT64 + __builtin_ctzll(bits);
                if (pred(index / SIZE, index % SIZE)) return true;
                bits &= bits - 1;
            }
        }
        return false;
    }

    // Positions of all set bits, T must be constructible from (row, col)
    template <typename T>
    std::vector<T> getSetPositions() const {
        std::vector<T> positions;
        positions.reserve(count());
        forEachSet([&positions](int row, int col) { positions.emplace_back(row, col); });
        return positions;
    }
};

} // namespace pente

#endif // PENTE_BITBOARD_HPP
