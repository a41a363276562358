#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "board.h"
#include "eval.h"
#include "move.h"
#include "search.h"

namespace isolation {

// A player the match driver can ask for moves. The board is a copy owned by
// the driver; legalMoves are the moves of the side to move.
class Agent {
   public:
    virtual ~Agent() = default;
    virtual std::string name() const = 0;
    virtual Move get_move(const Board& board, const MoveList& legalMoves,
                          const TimeLeftFn& timeLeft) = 0;
};

// Time-bounded minimax / alpha-beta player.
class SearchAgent : public Agent {
   public:
    explicit SearchAgent(const SearchConfig& config = SearchConfig(),
                         InfoCallback infoCallback = nullptr);

    std::string name() const override;
    Move get_move(const Board& board, const MoveList& legalMoves,
                  const TimeLeftFn& timeLeft) override;

    const SearchConfig& config() const {
        return searchConfig;
    }
    const SearchStats& last_stats() const {
        return lastStats;
    }

   private:
    SearchConfig searchConfig;
    InfoCallback info;
    SearchStats lastStats;
};

// Uniformly random legal move.
class RandomAgent : public Agent {
   public:
    explicit RandomAgent(uint32_t seed = 1);

    std::string name() const override;
    Move get_move(const Board& board, const MoveList& legalMoves,
                  const TimeLeftFn& timeLeft) override;

   private:
    std::mt19937 rng;
};

// One-ply lookahead: the move whose resulting board scores best.
class GreedyAgent : public Agent {
   public:
    explicit GreedyAgent(const EvalParams& params = EvalParams());

    std::string name() const override;
    Move get_move(const Board& board, const MoveList& legalMoves,
                  const TimeLeftFn& timeLeft) override;

   private:
    EvalParams evalParams;
};

}  // namespace isolation
