#pragma once

#include <cstdint>
#include <string>

#include "bitboard.h"
#include "move.h"
#include "types.h"

namespace isolation {

// Isolation board. Small enough to copy on every forecast, so the search never
// makes and unmakes moves on a shared instance.
class Board {
   public:
    Board();
    Board(int width, int height);

    // Position text interface: rows top to bottom separated by '/', '.' blank,
    // 'X' blocked, '1'/'2' player locations, then the side to move.
    // Example: "1X./.../2X. 1". Returns false and leaves the board unchanged on
    // malformed input.
    bool set_position(const std::string& position);
    std::string to_position() const;

    // ASCII display
    std::string print() const;

    // Accessors
    int width() const {
        return boardWidth;
    }
    int height() const {
        return boardHeight;
    }
    int cell_count() const {
        return boardWidth * boardHeight;
    }
    Player side_to_move() const {
        return sideToMove;
    }
    int move_count() const {
        return moveCount;
    }
    Square location(Player p) const {
        return playerSquare[p];
    }
    bool is_placed(Player p) const {
        return playerSquare[p] != NoSquare;
    }

    Bitboard cells() const {
        return cellMask;
    }
    Bitboard blocked() const {
        return blockedBB;
    }
    Bitboard blank_spaces() const {
        return cellMask & ~blockedBB;
    }
    int blank_count() const {
        return popcount(blank_spaces());
    }
    bool is_on_board(int row, int col) const {
        return row >= 0 && row < boardHeight && col >= 0 && col < boardWidth;
    }

    // Move the side to move onto a blank square (modifies in place)
    void make_move(Move m);

    // Copy of this board with the move applied; this board is left unmodified
    Board forecast_move(Move m) const;

   private:
    void clear(int width, int height);

    int boardWidth;
    int boardHeight;
    Bitboard cellMask;   // squares that belong to the board
    Bitboard blockedBB;  // visited squares, including both current locations
    Square playerSquare[PlayerCount];

    Player sideToMove;
    int moveCount;
};

}  // namespace isolation
