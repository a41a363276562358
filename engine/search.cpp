#include "search.h"

#include <chrono>
#include <cmath>
#include <limits>

#include "misc.h"
#include "movegen.h"

namespace isolation {

const char* search_method_name(SearchMethod method) {
    return method == SearchMethod::AlphaBeta ? "AlphaBeta" : "Minimax";
}

bool parse_search_method(std::string_view value, SearchMethod& methodOut) {
    if (equals_case_insensitive(value, "Minimax")) {
        methodOut = SearchMethod::Minimax;
        return true;
    }

    if (equals_case_insensitive(value, "AlphaBeta") ||
        equals_case_insensitive(value, "alpha-beta")) {
        methodOut = SearchMethod::AlphaBeta;
        return true;
    }

    return false;
}

static double evaluateLeaf(const Board& board, SearchState& state) {
    ++state.stats.evaluations;
    return evaluate(board, state.us, state.config.eval);
}

// ============================================================
// Minimax
// ============================================================

SearchResult minimax(const Board& board, int depth, bool maximizing, SearchState& state) {
    if (state.checkTime())
        return {NoMove, 0.0};

    ++state.stats.nodes;

    if (depth == 0)
        return {NoMove, evaluateLeaf(board, state)};

    // A side with no legal moves keeps the sentinel: it has lost.
    SearchResult best = {NoMove, maximizing ? -ScoreInfinity : ScoreInfinity};

    MoveList moves = generate_legal(board);
    for (Move m : moves) {
        SearchResult child = minimax(board.forecast_move(m), depth - 1, !maximizing, state);

        if (state.stopped)
            return {NoMove, 0.0};

        // Strict comparison: the first of equally scored moves wins
        if (maximizing ? child.score > best.score : child.score < best.score) {
            best.score = child.score;
            best.bestMove = m;
        }
    }

    return best;
}

// ============================================================
// Alpha-beta
// ============================================================

SearchResult alphabeta(const Board& board, int depth, double alpha, double beta,
                       bool maximizing, SearchState& state) {
    if (state.checkTime())
        return {NoMove, 0.0};

    ++state.stats.nodes;

    MoveList moves = generate_legal(board);

    // Dead nodes are scored directly instead of returning a sentinel
    if (depth == 0 || moves.size() == 0)
        return {NoMove, evaluateLeaf(board, state)};

    if (maximizing) {
        SearchResult best = {NoMove, -ScoreInfinity};
        for (Move m : moves) {
            SearchResult child =
                alphabeta(board.forecast_move(m), depth - 1, alpha, beta, false, state);

            if (state.stopped)
                return {NoMove, 0.0};

            if (child.score > best.score) {
                best.score = child.score;
                best.bestMove = m;
            }
            if (best.score > alpha)
                alpha = best.score;
            if (beta <= alpha)
                break;  // the minimizer above will never allow this line
        }
        return best;
    }

    SearchResult best = {NoMove, ScoreInfinity};
    for (Move m : moves) {
        SearchResult child =
            alphabeta(board.forecast_move(m), depth - 1, alpha, beta, true, state);

        if (state.stopped)
            return {NoMove, 0.0};

        if (child.score < best.score) {
            best.score = child.score;
            best.bestMove = m;
        }
        if (best.score < beta)
            beta = best.score;
        if (beta <= alpha)
            break;
    }
    return best;
}

// ============================================================
// Root search
// ============================================================

SearchResult search_depth(const Board& board, int depth, SearchState& state) {
    if (state.config.method == SearchMethod::AlphaBeta)
        return alphabeta(board, depth, -ScoreInfinity, ScoreInfinity, true, state);
    return minimax(board, depth, true, state);
}

SearchResult iterative_deepening(const Board& board, SearchState& state,
                                 const InfoCallback& infoCallback) {
    SearchResult bestResult = {NoMove, -ScoreInfinity};

    int maxDepth = state.config.maxDepth > 0 ? state.config.maxDepth
                                             : std::numeric_limits<int>::max();

    // No line of play is longer than the number of blank squares
    int exhaustiveDepth = board.blank_count();

    for (int depth = 1; depth <= maxDepth; ++depth) {
        SearchResult result = search_depth(board, depth, state);

        if (state.stopped)
            break;  // Discard partial iteration, use previous result
        bestResult = result;
        state.stats.depthReached = depth;

        if (infoCallback) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - state.startTime)
                               .count();

            SearchInfo info;
            info.depth = depth;
            info.score = bestResult.score;
            info.bestMove = bestResult.bestMove;
            info.nodes = state.stats.nodes;
            info.timeMs = static_cast<int64_t>(elapsed);
            infoCallback(info);
        }

        // A proven win or loss does not change with depth
        if (std::isinf(bestResult.score) || depth >= exhaustiveDepth)
            break;
    }

    return bestResult;
}

// ============================================================
// Public API
// ============================================================

Move opening_move(const Board& board) {
    return make_move(board.height() / 2, board.width() / 2);
}

Move get_move(const Board& board, const MoveList& legalMoves, const TimeLeftFn& timeLeft,
              const SearchConfig& config, SearchStats* stats, const InfoCallback& infoCallback) {
    if (legalMoves.size() == 0)
        return NoMove;

    // First move of the game: every square is open
    if (count_legal(board, board.side_to_move()) == board.cell_count())
        return opening_move(board);

    SearchState state(board.side_to_move(), config, timeLeft);
    SearchResult result = {NoMove, -ScoreInfinity};

    if (config.iterative) {
        result = iterative_deepening(board, state, infoCallback);
    } else {
        int depth = config.depth < 1 ? 1 : config.depth;
        result = search_depth(board, depth, state);
        if (state.stopped)
            result = {NoMove, -ScoreInfinity};
        else
            state.stats.depthReached = depth;
    }

    if (stats)
        *stats = state.stats;

    // Every root move loses against best play; keep playing a legal one.
    if (result.bestMove == NoMove && state.stats.depthReached > 0)
        return legalMoves[0];

    return result.bestMove;
}

}  // namespace isolation
