#pragma once

#include <limits>
#include <string_view>

#include "board.h"

namespace isolation {

// Reserved scores: the evaluated player has already lost / already won.
constexpr double ScoreInfinity = std::numeric_limits<double>::infinity();

constexpr double DefaultChaserWeight = 2.0;

// Heuristic applied to non-terminal states.
enum class EvalMode {
    AggressiveChaser,  // own - weight * opp
    MobilityRatio,     // own / occupancy
    Blend,             // own + distance - occupancy - opp
    OpenMove,          // own
    Improved,          // own - opp
};

struct EvalParams {
    EvalMode mode = EvalMode::Blend;
    double chaserWeight = DefaultChaserWeight;
};

const char* eval_mode_name(EvalMode mode);
bool parse_eval_mode(std::string_view value, EvalMode& modeOut);

// Fraction of the board's cells that are blocked, in [0, 1].
double occupancy_fraction(const Board& board);

// Taxicab distance between the two players, 0 while either is unplaced.
int taxicab_distance(const Board& board, Player p);

// Heuristic terms alone, without the terminal shortcut.
double evaluate_aggressive_chaser(const Board& board, Player p,
                                  double weightOpp = DefaultChaserWeight);
double evaluate_mobility_ratio(const Board& board, Player p);
double evaluate_blend(const Board& board, Player p);
double evaluate_open_move(const Board& board, Player p);
double evaluate_improved(const Board& board, Player p);

// Score of the board from p's point of view, higher is better for p.
// Lost and won positions return -ScoreInfinity / +ScoreInfinity before any
// heuristic term is computed.
double evaluate(const Board& board, Player p, const EvalParams& params);

}  // namespace isolation
