#include "movegen.h"

#include "attacks.h"

namespace isolation {

Bitboard move_targets(const Board& board, Player p) {
    Bitboard blank = board.blank_spaces();
    if (!board.is_placed(p))
        return blank;
    return attacks::knight_attacks(board.location(p)) & blank;
}

MoveList generate_legal(const Board& board, Player p) {
    MoveList moves;
    Bitboard targets = move_targets(board, p);
    while (targets) moves.add(pop_lsb(targets));
    return moves;
}

MoveList generate_legal(const Board& board) {
    return generate_legal(board, board.side_to_move());
}

int count_legal(const Board& board, Player p) {
    return popcount(move_targets(board, p));
}

bool has_legal_moves(const Board& board, Player p) {
    return move_targets(board, p) != 0;
}

bool is_loser(const Board& board, Player p) {
    return board.side_to_move() == p && !has_legal_moves(board, p);
}

bool is_winner(const Board& board, Player p) {
    return is_loser(board, ~p);
}

bool is_game_over(const Board& board) {
    return !has_legal_moves(board, board.side_to_move());
}

} // namespace isolation
