#include "match.h"

#include <chrono>

#include "movegen.h"

namespace isolation {

const char* outcome_name(GameOutcome outcome) {
    switch (outcome) {
        case GameOutcome::NoLegalMoves:
            return "no legal moves";
        case GameOutcome::Timeout:
            return "timeout";
        case GameOutcome::IllegalMove:
            return "illegal move";
    }
    return "unknown";
}

MatchResult play_match(Board board, Agent& first, Agent& second, int timeLimitMs) {
    MatchResult result;
    Agent* agents[PlayerCount];
    agents[board.side_to_move()] = &first;
    agents[~board.side_to_move()] = &second;

    while (true) {
        Player mover = board.side_to_move();
        MoveList legal = generate_legal(board);

        if (legal.size() == 0) {
            result.winner = ~mover;
            result.outcome = GameOutcome::NoLegalMoves;
            break;
        }

        auto start = std::chrono::steady_clock::now();
        TimeLeftFn timeLeft = [start, timeLimitMs]() {
            auto elapsed = std::chrono::duration<double, std::milli>(
                               std::chrono::steady_clock::now() - start)
                               .count();
            return timeLimitMs - elapsed;
        };

        Move m = agents[mover]->get_move(board, legal, timeLeft);

        if (timeLeft() <= 0.0) {
            result.winner = ~mover;
            result.outcome = GameOutcome::Timeout;
            break;
        }
        if (!legal.contains(m)) {
            result.winner = ~mover;
            result.outcome = GameOutcome::IllegalMove;
            break;
        }

        board.make_move(m);
        result.history.push_back(m);
    }

    result.finalBoard = board;
    return result;
}

TournamentResult run_tournament(Agent& agent, Agent& opponent, int games, int timeLimitMs,
                                int width, int height) {
    TournamentResult tally;

    for (int game = 0; game < games; ++game) {
        Board board(width, height);
        bool agentFirst = (game % 2 == 0);
        MatchResult match = agentFirst ? play_match(board, agent, opponent, timeLimitMs)
                                       : play_match(board, opponent, agent, timeLimitMs);

        Player agentSide = agentFirst ? Player1 : Player2;
        if (match.winner == agentSide) {
            ++tally.wins;
        } else {
            ++tally.losses;
            if (match.outcome == GameOutcome::Timeout)
                ++tally.timeouts;
        }
    }

    return tally;
}

}  // namespace isolation
