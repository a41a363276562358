#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include "board.h"
#include "eval.h"
#include "move.h"

namespace isolation {

constexpr double DefaultTimerThresholdMs = 10.0;
constexpr int DefaultSearchDepth = 3;

enum class SearchMethod {
    Minimax,
    AlphaBeta,
};

const char* search_method_name(SearchMethod method);
bool parse_search_method(std::string_view value, SearchMethod& methodOut);

struct SearchConfig {
    int depth = DefaultSearchDepth;  // used when iterative deepening is off
    EvalParams eval;
    bool iterative = true;
    SearchMethod method = SearchMethod::Minimax;
    double timerThresholdMs = DefaultTimerThresholdMs;
    int maxDepth = 0;  // iterative deepening cap, 0 = unbounded
};

// Milliseconds left on the caller's clock for the current turn
using TimeLeftFn = std::function<double()>;

struct SearchResult {
    Move bestMove;
    double score;
};

struct SearchStats {
    uint64_t nodes = 0;
    uint64_t evaluations = 0;
    int depthReached = 0;  // last depth that completed
    bool timedOut = false;
};

struct SearchInfo {
    int depth;
    double score;
    Move bestMove;
    uint64_t nodes;
    int64_t timeMs;
};

using InfoCallback = std::function<void(const SearchInfo&)>;

// Per-call search context. Owned by a single move selection; nothing in it
// survives the call.
struct SearchState {
    Player us;  // the maximizing player, scored at the leaves
    const SearchConfig& config;
    const TimeLeftFn& timeLeft;
    std::chrono::steady_clock::time_point startTime;
    bool stopped;
    SearchStats stats;

    SearchState(Player us_, const SearchConfig& config_, const TimeLeftFn& timeLeft_)
        : us(us_),
          config(config_),
          timeLeft(timeLeft_),
          startTime(std::chrono::steady_clock::now()),
          stopped(false) {}

    // Sets the stop flag once the clock reaches the safety threshold.
    bool checkTime() {
        if (stopped)
            return true;
        if (timeLeft() <= config.timerThresholdMs) {
            stopped = true;
            stats.timedOut = true;
        }
        return stopped;
    }
};

// Depth-limited minimax. Returns NoMove with the layer's sentinel score when
// the side to move has no legal move. Meaningless once state.stopped is set.
SearchResult minimax(const Board& board, int depth, bool maximizing, SearchState& state);

// Minimax with alpha-beta pruning; same root score as minimax.
SearchResult alphabeta(const Board& board, int depth, double alpha, double beta,
                       bool maximizing, SearchState& state);

// One full-window search of the configured method, maximizing at the root.
SearchResult search_depth(const Board& board, int depth, SearchState& state);

// Deepen one ply at a time until the clock runs out. Returns the result of the
// last depth that completed, {NoMove, -inf} if none did.
SearchResult iterative_deepening(const Board& board, SearchState& state,
                                 const InfoCallback& infoCallback = nullptr);

// Center of the board, played as the first move of a game.
Move opening_move(const Board& board);

// Move selection entry point for the side to move.
Move get_move(const Board& board, const MoveList& legalMoves, const TimeLeftFn& timeLeft,
              const SearchConfig& config, SearchStats* stats = nullptr,
              const InfoCallback& infoCallback = nullptr);

}  // namespace isolation
