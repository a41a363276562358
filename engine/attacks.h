#pragma once

#include "types.h"
#include "bitboard.h"
#include <cstdint>

namespace isolation {
namespace attacks {

// Knight jump targets on the full 8x8 grid. Callers mask the result with the
// board's blank squares, which also clips it to the board's width and height.
extern Bitboard KnightAttacks[SquareCount];

inline Bitboard knight_attacks(Square s) { return KnightAttacks[s]; }

void init();

} // namespace attacks
} // namespace isolation
