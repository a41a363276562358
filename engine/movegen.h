#pragma once

#include "board.h"
#include "move.h"
#include <cstdint>

namespace isolation {

// Squares the player could move to: every blank square before the player is
// placed, its knight jumps onto blank squares afterwards.
Bitboard move_targets(const Board& board, Player p);

// Legal moves in ascending square order (row-major)
MoveList generate_legal(const Board& board);
MoveList generate_legal(const Board& board, Player p);

int count_legal(const Board& board, Player p);
bool has_legal_moves(const Board& board, Player p);

// The player is to move and cannot
bool is_loser(const Board& board, Player p);
// The opponent is to move and cannot
bool is_winner(const Board& board, Player p);
bool is_game_over(const Board& board);

} // namespace isolation
