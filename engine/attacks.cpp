#include "attacks.h"

namespace isolation {
namespace attacks {

Bitboard KnightAttacks[SquareCount];

static void init_knight_attacks() {
    for (int sq = 0; sq < SquareCount; ++sq) {
        Bitboard bb = Bitboard(1) << sq;
        Bitboard attacks = 0;
        // 8 L-shaped jumps with column-wrap guards
        attacks |= (bb & ~ColMask[0] & ~ColMask[1]) << 6;   // down-1, left-2
        attacks |= (bb & ~ColMask[0]) << 15;                // down-2, left-1
        attacks |= (bb & ~ColMask[7]) << 17;                // down-2, right-1
        attacks |= (bb & ~ColMask[6] & ~ColMask[7]) << 10;  // down-1, right-2
        attacks |= (bb & ~ColMask[6] & ~ColMask[7]) >> 6;   // up-1, right-2
        attacks |= (bb & ~ColMask[7]) >> 15;                // up-2, right-1
        attacks |= (bb & ~ColMask[0]) >> 17;                // up-2, left-1
        attacks |= (bb & ~ColMask[0] & ~ColMask[1]) >> 10;  // up-1, left-2
        KnightAttacks[sq] = attacks;
    }
}

void init() {
    init_knight_attacks();
}

}  // namespace attacks
}  // namespace isolation
