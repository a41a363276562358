#include "protocol.h"

#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

#include "agent.h"
#include "attacks.h"
#include "board.h"
#include "match.h"
#include "misc.h"
#include "move.h"
#include "movegen.h"
#include "search.h"

namespace isolation {

static const char* ENGINE_NAME = "Isolation";
static const char* ENGINE_AUTHOR = "Isolation Team";
static constexpr int DEFAULT_MOVETIME_MS = 1000;
static constexpr int DEFAULT_MATCH_GAMES = 10;
static constexpr int MAX_OPTION_DEPTH = 64;

static bool parseInt(const std::string& str, int& valueOut) {
    std::istringstream iss(str);
    int value;
    char extra;
    if (!(iss >> value) || (iss >> extra))
        return false;
    valueOut = value;
    return true;
}

static bool parseDouble(const std::string& str, double& valueOut) {
    std::istringstream iss(str);
    double value;
    char extra;
    if (!(iss >> value) || (iss >> extra) || !std::isfinite(value))
        return false;
    valueOut = value;
    return true;
}

static bool parseBool(const std::string& str, bool& valueOut) {
    if (equals_case_insensitive(str, "true") || str == "1") {
        valueOut = true;
        return true;
    }
    if (equals_case_insensitive(str, "false") || str == "0") {
        valueOut = false;
        return true;
    }
    return false;
}

static std::string scoreToStr(double score) {
    if (std::isinf(score))
        return score > 0 ? "win" : "loss";
    std::ostringstream os;
    os << score;
    return os.str();
}

static TimeLeftFn makeClock(int timeLimitMs) {
    auto start = std::chrono::steady_clock::now();
    return [start, timeLimitMs]() {
        auto elapsed =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
                .count();
        return timeLimitMs - elapsed;
    };
}

// Optional "W H" board size. On return `token` holds the next unread token.
static bool parseBoardSize(std::istringstream& iss, int& width, int& height, std::string& token) {
    width = DefaultBoardWidth;
    height = DefaultBoardHeight;
    token.clear();
    if (!(iss >> token))
        return true;
    int w, h;
    if (!parseInt(token, w))
        return true;  // not a size, leave token for the caller
    std::string hToken;
    if (!(iss >> hToken) || !parseInt(hToken, h))
        return false;
    if (w < 1 || w > MaxBoardSize || h < 1 || h > MaxBoardSize)
        return false;
    width = w;
    height = h;
    token.clear();
    iss >> token;
    return true;
}

// Handle "position" command
static void parsePosition(Board& board, std::istringstream& iss, std::ostream& out) {
    std::string token;
    iss >> token;

    Board parsed;
    if (token == "startpos") {
        int width, height;
        if (!parseBoardSize(iss, width, height, token)) {
            out << "info string invalid board size" << std::endl;
            return;
        }
        parsed = Board(width, height);
    } else {
        std::string side;
        iss >> side;
        if (!parsed.set_position(token + " " + side)) {
            out << "info string invalid position " << token << " " << side << std::endl;
            return;
        }
        token.clear();
        iss >> token;
    }

    // Apply moves if present
    if (token == "moves") {
        while (iss >> token) {
            Move m;
            if (!parse_move(token, m) || !generate_legal(parsed).contains(m)) {
                out << "info string illegal move " << token << std::endl;
                break;
            }
            parsed.make_move(m);
        }
    }

    board = parsed;
}

// Handle "go" command
static void parseGoAndSearch(const Board& board, std::istringstream& iss,
                             const SearchConfig& config, std::ostream& out) {
    int movetime = DEFAULT_MOVETIME_MS;
    int depth = 0;

    std::string token;
    while (iss >> token) {
        if (token == "movetime")
            iss >> movetime;
        else if (token == "depth")
            iss >> depth;
    }

    SearchConfig goConfig = config;
    if (depth > 0) {
        goConfig.iterative = false;
        goConfig.depth = depth;
    }

    auto infoCb = [&out](const SearchInfo& info) {
        out << "info depth " << info.depth << " score " << scoreToStr(info.score) << " nodes "
            << info.nodes << " time " << info.timeMs << " move " << move_to_str(info.bestMove)
            << std::endl;
    };

    SearchStats stats;
    MoveList legal = generate_legal(board);
    Move best = get_move(board, legal, makeClock(movetime), goConfig, &stats, infoCb);

    if (stats.timedOut)
        out << "info string timeout after depth " << stats.depthReached << std::endl;
    out << "bestmove " << move_to_str(best) << std::endl;
}

// Handle "setoption name <name> value <value>"
static void parseSetOption(std::istringstream& iss, SearchConfig& config, std::ostream& out) {
    std::string token, name, value;
    iss >> token;  // "name"
    iss >> name;
    // Read multi-word option names
    while (iss >> token && token != "value") name += " " + token;
    if (!(iss >> value)) {
        out << "info string missing value for option " << name << std::endl;
        return;
    }

    bool ok = false;
    if (equals_case_insensitive(name, "Depth")) {
        int depth;
        ok = parseInt(value, depth) && depth >= 1 && depth <= MAX_OPTION_DEPTH;
        if (ok)
            config.depth = depth;
    } else if (equals_case_insensitive(name, "MaxDepth")) {
        int maxDepth;
        ok = parseInt(value, maxDepth) && maxDepth >= 0 && maxDepth <= MAX_OPTION_DEPTH;
        if (ok)
            config.maxDepth = maxDepth;
    } else if (equals_case_insensitive(name, "Eval")) {
        ok = parse_eval_mode(value, config.eval.mode);
    } else if (equals_case_insensitive(name, "ChaserWeight")) {
        ok = parseDouble(value, config.eval.chaserWeight);
    } else if (equals_case_insensitive(name, "Iterative")) {
        ok = parseBool(value, config.iterative);
    } else if (equals_case_insensitive(name, "Method")) {
        ok = parse_search_method(value, config.method);
    } else if (equals_case_insensitive(name, "Timeout")) {
        double threshold;
        ok = parseDouble(value, threshold) && threshold >= 0.0;
        if (ok)
            config.timerThresholdMs = threshold;
    } else {
        out << "info string unknown option " << name << std::endl;
        return;
    }

    if (!ok)
        out << "info string invalid value " << value << " for option " << name << std::endl;
}

// Handle "match <random|greedy|self> [games N] [movetime N]"
static void parseMatch(std::istringstream& iss, const Board& board, const SearchConfig& config,
                       std::ostream& out) {
    std::string opponentName = "random";
    int games = DEFAULT_MATCH_GAMES;
    int movetime = DEFAULT_MOVETIME_MS;

    std::string token;
    if (iss >> token)
        opponentName = token;
    while (iss >> token) {
        if (token == "games")
            iss >> games;
        else if (token == "movetime")
            iss >> movetime;
    }

    RandomAgent randomAgent;
    GreedyAgent greedyAgent;
    SearchAgent selfAgent;
    Agent* opponent = nullptr;
    if (opponentName == "random")
        opponent = &randomAgent;
    else if (opponentName == "greedy")
        opponent = &greedyAgent;
    else if (opponentName == "self")
        opponent = &selfAgent;

    if (!opponent || games < 1 || movetime < 1) {
        out << "info string usage: match <random|greedy|self> [games N] [movetime N]" << std::endl;
        return;
    }

    SearchAgent agent(config);
    TournamentResult tally =
        run_tournament(agent, *opponent, games, movetime, board.width(), board.height());

    out << "info string " << agent.name() << " vs " << opponent->name() << std::endl;
    out << "result wins " << tally.wins << " losses " << tally.losses << " timeouts "
        << tally.timeouts << std::endl;
}

static void printOptions(const SearchConfig& config, std::ostream& out) {
    out << "option name Depth type spin default " << config.depth << " min 1 max "
        << MAX_OPTION_DEPTH << std::endl;
    out << "option name MaxDepth type spin default " << config.maxDepth << " min 0 max "
        << MAX_OPTION_DEPTH << std::endl;
    out << "option name Eval type combo default " << eval_mode_name(config.eval.mode)
        << " var AggressiveChaser var MobilityRatio var Blend var OpenMove var Improved"
        << std::endl;
    out << "option name ChaserWeight type string default " << config.eval.chaserWeight
        << std::endl;
    out << "option name Iterative type check default " << (config.iterative ? "true" : "false")
        << std::endl;
    out << "option name Method type combo default " << search_method_name(config.method)
        << " var Minimax var AlphaBeta" << std::endl;
    out << "option name Timeout type string default " << config.timerThresholdMs << std::endl;
}

void protocol_loop(std::istream& in, std::ostream& out) {
    // Initialize engine tables
    attacks::init();

    Board board;
    SearchConfig config;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "id") {
            out << "id name " << ENGINE_NAME << std::endl;
            out << "id author " << ENGINE_AUTHOR << std::endl;
            printOptions(config, out);
            out << "idok" << std::endl;
        } else if (cmd == "isready") {
            out << "readyok" << std::endl;
        } else if (cmd == "newgame") {
            int width, height;
            std::string rest;
            if (!parseBoardSize(iss, width, height, rest) || !rest.empty()) {
                out << "info string invalid board size" << std::endl;
                continue;
            }
            board = Board(width, height);
        } else if (cmd == "position") {
            parsePosition(board, iss, out);
        } else if (cmd == "go") {
            parseGoAndSearch(board, iss, config, out);
        } else if (cmd == "setoption") {
            parseSetOption(iss, config, out);
        } else if (cmd == "print") {
            out << board.print();
        } else if (cmd == "match") {
            parseMatch(iss, board, config, out);
        } else if (cmd == "quit") {
            break;
        } else if (!cmd.empty()) {
            out << "info string unknown command " << cmd << std::endl;
        }
    }
}

void protocol_loop() {
    protocol_loop(std::cin, std::cout);
}

}  // namespace isolation
