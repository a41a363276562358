#pragma once

#include <cstdint>

namespace isolation {

enum Player : uint8_t {
    Player1,
    Player2,
    PlayerCount = 2
};

constexpr Player operator~(Player p) { return Player(p ^ 1); }

// Cells are indexed on a fixed 8-column grid: square = row * 8 + col.
// Boards narrower or shorter than 8 use a subset of the 64 squares.
using Square = uint8_t;

constexpr int MaxBoardSize = 8;
constexpr int SquareCount = MaxBoardSize * MaxBoardSize;
constexpr Square NoSquare = 255;

constexpr int DefaultBoardWidth = 7;
constexpr int DefaultBoardHeight = 7;

// Helper functions

constexpr Square make_square(int row, int col) {
    return Square(row * MaxBoardSize + col);
}

constexpr int square_row(Square s) { return s / MaxBoardSize; }
constexpr int square_col(Square s) { return s % MaxBoardSize; }

constexpr char player_char(Player p) {
    return p == Player1 ? '1' : '2';
}

} // namespace isolation
