#pragma once

#include "board.hpp"
#include <cstdint>
#include <random>

namespace slidegraph {

// Random keys per (piece size, origin cell). XOR over a board's pieces gives a
// hash independent of piece order.
class Zobrist {
public:
    static constexpr int NUM_SIZES = 4;  // 1x1, 1x2, 2x1, 2x2
    static constexpr int MAX_CELLS = Board::MAX_CELLS;

    static const Zobrist& instance() {
        static const Zobrist z;
        return z;
    }

    // size_code in 1..4, cell = y * width + x
    uint64_t piece_key(int size_code, int cell) const noexcept {
        return keys_[size_code - 1][cell];
    }

private:
    uint64_t keys_[NUM_SIZES][MAX_CELLS];

    Zobrist() {
        // Fixed seed so hashes are reproducible across runs
        std::mt19937_64 rng(0x5EEDB10CCAFEF00DULL);
        for (int s = 0; s < NUM_SIZES; ++s) {
            for (int i = 0; i < MAX_CELLS; ++i) {
                keys_[s][i] = rng();
            }
        }
    }
};

} // namespace slidegraph
