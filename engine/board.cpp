#include "board.h"
#include <sstream>
#include <vector>
#include <cassert>

namespace isolation {

Board::Board() {
    clear(DefaultBoardWidth, DefaultBoardHeight);
}

Board::Board(int width, int height) {
    assert(width >= 1 && width <= MaxBoardSize);
    assert(height >= 1 && height <= MaxBoardSize);
    clear(width, height);
}

void Board::clear(int width, int height) {
    boardWidth = width;
    boardHeight = height;
    cellMask = board_mask(width, height);
    blockedBB = 0;
    for (int i = 0; i < PlayerCount; ++i) playerSquare[i] = NoSquare;
    sideToMove = Player1;
    moveCount = 0;
}

void Board::make_move(Move m) {
    assert(m != NoMove);
    assert(blank_spaces() & square_bb(m));

    blockedBB |= square_bb(m);
    playerSquare[sideToMove] = m;
    sideToMove = ~sideToMove;
    ++moveCount;
}

Board Board::forecast_move(Move m) const {
    Board child = *this;
    child.make_move(m);
    return child;
}

bool Board::set_position(const std::string& position) {
    std::istringstream ss(position);
    std::string rowsToken, sideToken, extra;
    if (!(ss >> rowsToken >> sideToken) || (ss >> extra))
        return false;

    // 1. Rows
    std::vector<std::string> rows;
    std::string row;
    std::istringstream rs(rowsToken);
    while (std::getline(rs, row, '/')) rows.push_back(row);
    if (!rowsToken.empty() && rowsToken.back() == '/')
        return false;

    int height = static_cast<int>(rows.size());
    if (height < 1 || height > MaxBoardSize)
        return false;
    int width = static_cast<int>(rows[0].size());
    if (width < 1 || width > MaxBoardSize)
        return false;

    Board parsed(width, height);
    for (int r = 0; r < height; ++r) {
        if (static_cast<int>(rows[r].size()) != width)
            return false;
        for (int c = 0; c < width; ++c) {
            Square s = make_square(r, c);
            switch (rows[r][c]) {
                case '.':
                    break;
                case 'X':
                    parsed.blockedBB |= square_bb(s);
                    break;
                case '1':
                case '2': {
                    Player p = rows[r][c] == '1' ? Player1 : Player2;
                    if (parsed.playerSquare[p] != NoSquare)
                        return false;
                    parsed.playerSquare[p] = s;
                    parsed.blockedBB |= square_bb(s);
                    break;
                }
                default:
                    return false;
            }
        }
    }

    // 2. Side to move
    if (sideToken == "1")
        parsed.sideToMove = Player1;
    else if (sideToken == "2")
        parsed.sideToMove = Player2;
    else
        return false;

    parsed.moveCount = popcount(parsed.blockedBB);
    *this = parsed;
    return true;
}

std::string Board::to_position() const {
    std::ostringstream pos;

    for (int r = 0; r < boardHeight; ++r) {
        for (int c = 0; c < boardWidth; ++c) {
            Square s = make_square(r, c);
            if (s == playerSquare[Player1])
                pos << '1';
            else if (s == playerSquare[Player2])
                pos << '2';
            else if (blockedBB & square_bb(s))
                pos << 'X';
            else
                pos << '.';
        }
        if (r + 1 < boardHeight) pos << '/';
    }

    pos << ' ' << player_char(sideToMove);
    return pos.str();
}

std::string Board::print() const {
    std::ostringstream os;
    std::string separator = "  ";
    for (int c = 0; c < boardWidth; ++c) separator += "+---";
    separator += "+\n";

    os << "  ";
    for (int c = 0; c < boardWidth; ++c) os << "  " << c << ' ';
    os << '\n' << separator;
    for (int r = 0; r < boardHeight; ++r) {
        os << r << ' ';
        for (int c = 0; c < boardWidth; ++c) {
            Square s = make_square(r, c);
            char cell = ' ';
            if (s == playerSquare[Player1])
                cell = '1';
            else if (s == playerSquare[Player2])
                cell = '2';
            else if (blockedBB & square_bb(s))
                cell = '-';
            os << "| " << cell << ' ';
        }
        os << "|\n" << separator;
    }
    os << "\nPosition: " << to_position() << '\n';
    os << "Side to move: " << player_char(sideToMove) << '\n';
    return os.str();
}

}  // namespace isolation
