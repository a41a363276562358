#include "eval.h"

#include <cstdlib>

#include "misc.h"
#include "movegen.h"

namespace isolation {

namespace {

struct EvalModeEntry {
    EvalMode mode;
    const char* name;
    const char* alias;
};

constexpr EvalModeEntry EvalModes[] = {
    {EvalMode::AggressiveChaser, "AggressiveChaser", "chaser"},
    {EvalMode::MobilityRatio, "MobilityRatio", "ratio"},
    {EvalMode::Blend, "Blend", "blend"},
    {EvalMode::OpenMove, "OpenMove", "open"},
    {EvalMode::Improved, "Improved", "improved"},
};

}  // namespace

const char* eval_mode_name(EvalMode mode) {
    for (const EvalModeEntry& entry : EvalModes)
        if (entry.mode == mode)
            return entry.name;
    return "Unknown";
}

bool parse_eval_mode(std::string_view value, EvalMode& modeOut) {
    for (const EvalModeEntry& entry : EvalModes) {
        if (equals_case_insensitive(value, entry.name) ||
            equals_case_insensitive(value, entry.alias)) {
            modeOut = entry.mode;
            return true;
        }
    }
    return false;
}

// ============================================================
// Heuristic terms
// ============================================================

double occupancy_fraction(const Board& board) {
    return static_cast<double>(popcount(board.blocked())) / board.cell_count();
}

int taxicab_distance(const Board& board, Player p) {
    Square own = board.location(p);
    Square opp = board.location(~p);
    if (own == NoSquare || opp == NoSquare)
        return 0;
    return std::abs(square_row(own) - square_row(opp)) +
           std::abs(square_col(own) - square_col(opp));
}

double evaluate_aggressive_chaser(const Board& board, Player p, double weightOpp) {
    int ownMoves = count_legal(board, p);
    int oppMoves = count_legal(board, ~p);
    return ownMoves - weightOpp * oppMoves;
}

double evaluate_mobility_ratio(const Board& board, Player p) {
    int ownMoves = count_legal(board, p);
    double occupancy = occupancy_fraction(board);

    // Empty board: nothing to scale by
    if (occupancy <= 0.0)
        return ownMoves;
    return ownMoves / occupancy;
}

double evaluate_blend(const Board& board, Player p) {
    int ownMoves = count_legal(board, p);
    int oppMoves = count_legal(board, ~p);
    int distance = taxicab_distance(board, p);
    double occupancy = occupancy_fraction(board);

    return ownMoves + distance - occupancy - oppMoves;
}

double evaluate_open_move(const Board& board, Player p) {
    return count_legal(board, p);
}

double evaluate_improved(const Board& board, Player p) {
    return count_legal(board, p) - count_legal(board, ~p);
}

// ============================================================
// Main evaluation entry point
// ============================================================

double evaluate(const Board& board, Player p, const EvalParams& params) {
    // Game over: the side to move is stuck.
    if (is_loser(board, p))
        return -ScoreInfinity;
    if (is_winner(board, p))
        return ScoreInfinity;

    // Blocked squares never reopen, so a stuck player stays stuck.
    if (!has_legal_moves(board, p))
        return -ScoreInfinity;
    if (!has_legal_moves(board, ~p))
        return ScoreInfinity;

    switch (params.mode) {
        case EvalMode::AggressiveChaser:
            return evaluate_aggressive_chaser(board, p, params.chaserWeight);
        case EvalMode::MobilityRatio:
            return evaluate_mobility_ratio(board, p);
        case EvalMode::OpenMove:
            return evaluate_open_move(board, p);
        case EvalMode::Improved:
            return evaluate_improved(board, p);
        case EvalMode::Blend:
            break;
    }
    return evaluate_blend(board, p);
}

}  // namespace isolation
