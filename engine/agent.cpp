#include "agent.h"

#include <utility>

namespace isolation {

SearchAgent::SearchAgent(const SearchConfig& config, InfoCallback infoCallback)
    : searchConfig(config), info(std::move(infoCallback)) {}

std::string SearchAgent::name() const {
    std::string id = search_method_name(searchConfig.method);
    id += '/';
    id += eval_mode_name(searchConfig.eval.mode);
    if (!searchConfig.iterative)
        id += "/depth" + std::to_string(searchConfig.depth);
    return id;
}

Move SearchAgent::get_move(const Board& board, const MoveList& legalMoves,
                           const TimeLeftFn& timeLeft) {
    lastStats = SearchStats();
    return isolation::get_move(board, legalMoves, timeLeft, searchConfig, &lastStats, info);
}

RandomAgent::RandomAgent(uint32_t seed) : rng(seed) {}

std::string RandomAgent::name() const {
    return "Random";
}

Move RandomAgent::get_move(const Board&, const MoveList& legalMoves, const TimeLeftFn&) {
    if (legalMoves.size() == 0)
        return NoMove;
    std::uniform_int_distribution<int> pick(0, legalMoves.size() - 1);
    return legalMoves[pick(rng)];
}

GreedyAgent::GreedyAgent(const EvalParams& params) : evalParams(params) {}

std::string GreedyAgent::name() const {
    return std::string("Greedy/") + eval_mode_name(evalParams.mode);
}

Move GreedyAgent::get_move(const Board& board, const MoveList& legalMoves, const TimeLeftFn&) {
    Player us = board.side_to_move();
    Move bestMove = NoMove;
    double bestScore = -ScoreInfinity;

    for (Move m : legalMoves) {
        double score = evaluate(board.forecast_move(m), us, evalParams);
        if (bestMove == NoMove || score > bestScore) {
            bestScore = score;
            bestMove = m;
        }
    }
    return bestMove;
}

}  // namespace isolation
