#pragma once

#include "types.h"
#include <cctype>
#include <cstdint>
#include <string>

namespace isolation {

// A move is the square the player jumps to. NoMove means "no legal move
// available" and is printed as the (-1, -1) coordinate pair.

using Move = Square;
constexpr Move NoMove = NoSquare;

constexpr Move make_move(int row, int col) {
    return make_square(row, col);
}

constexpr int move_row(Move m) {
    return m == NoMove ? -1 : square_row(m);
}

constexpr int move_col(Move m) {
    return m == NoMove ? -1 : square_col(m);
}

inline std::string move_to_str(Move m) {
    return std::to_string(move_row(m)) + "," + std::to_string(move_col(m));
}

// Parse "row,col". Only checks the coordinates fit the 8x8 grid; whether the
// cell is on a given board is the caller's business.
inline bool parse_move(const std::string& str, Move& moveOut) {
    size_t comma = str.find(',');
    if (comma == std::string::npos || comma == 0 || comma + 1 >= str.size())
        return false;

    int coords[2] = {0, 0};
    std::string parts[2] = {str.substr(0, comma), str.substr(comma + 1)};
    for (int i = 0; i < 2; ++i) {
        if (parts[i].size() > 1)
            return false;
        if (!std::isdigit(static_cast<unsigned char>(parts[i][0])))
            return false;
        coords[i] = parts[i][0] - '0';
        if (coords[i] >= MaxBoardSize)
            return false;
    }

    moveOut = make_move(coords[0], coords[1]);
    return true;
}

struct MoveList {
    Move moves[SquareCount];
    int count = 0;

    void add(Move m) { moves[count++] = m; }
    int size() const { return count; }
    bool contains(Move m) const {
        for (int i = 0; i < count; ++i)
            if (moves[i] == m)
                return true;
        return false;
    }
    Move operator[](int i) const { return moves[i]; }
    Move* begin() { return moves; }
    Move* end() { return moves + count; }
    const Move* begin() const { return moves; }
    const Move* end() const { return moves + count; }
};

} // namespace isolation
