#pragma once

#include "types.h"
#include <cstdint>

namespace isolation {

using Bitboard = uint64_t;

// Square-to-bitboard lookup
constexpr Bitboard square_bb(Square s) {
    return Bitboard(1) << s;
}

// Column masks (col 0 = index 0)
constexpr Bitboard ColMask[8] = {
    0x0101010101010101ULL,
    0x0202020202020202ULL,
    0x0404040404040404ULL,
    0x0808080808080808ULL,
    0x1010101010101010ULL,
    0x2020202020202020ULL,
    0x4040404040404040ULL,
    0x8080808080808080ULL
};

// All squares inside a width x height board anchored at (0, 0)
constexpr Bitboard board_mask(int width, int height) {
    Bitboard rowBits = (width >= 8) ? 0xFFULL : ((Bitboard(1) << width) - 1);
    Bitboard mask = 0;
    for (int row = 0; row < height && row < 8; ++row)
        mask |= rowBits << (row * 8);
    return mask;
}

// Bit manipulation utilities
inline int popcount(Bitboard b) {
    return __builtin_popcountll(b);
}

inline Square lsb(Bitboard b) {
    return Square(__builtin_ctzll(b));
}

inline Square pop_lsb(Bitboard& b) {
    Square s = lsb(b);
    b &= b - 1;
    return s;
}

} // namespace isolation
