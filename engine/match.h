#pragma once

#include <cstdint>
#include <vector>

#include "agent.h"
#include "board.h"
#include "move.h"

namespace isolation {

enum class GameOutcome : uint8_t {
    NoLegalMoves,  // the loser was to move and could not
    Timeout,       // the loser answered after its clock ran out
    IllegalMove    // the loser answered with a move outside its legal list
};

const char* outcome_name(GameOutcome outcome);

struct MatchResult {
    Player winner = Player1;
    GameOutcome outcome = GameOutcome::NoLegalMoves;
    std::vector<Move> history;
    Board finalBoard;
};

// Play to the end from the given board. `first` moves for the board's side to
// move. Each turn gets timeLimitMs on a steady clock.
MatchResult play_match(Board board, Agent& first, Agent& second, int timeLimitMs);

struct TournamentResult {
    int wins = 0;
    int losses = 0;
    int timeouts = 0;  // losses on time
};

// Play `games` matches on fresh boards, alternating which agent moves first.
TournamentResult run_tournament(Agent& agent, Agent& opponent, int games, int timeLimitMs,
                                int width = DefaultBoardWidth, int height = DefaultBoardHeight);

}  // namespace isolation
