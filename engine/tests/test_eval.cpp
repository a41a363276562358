#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "../attacks.h"
#include "../board.h"
#include "../eval.h"

using namespace isolation;

class EvalTestEnvironment : public ::testing::Environment {
   public:
    void SetUp() override {
        attacks::init();
    }
};

static auto* env = ::testing::AddGlobalTestEnvironment(new EvalTestEnvironment);

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

static const EvalMode AllModes[] = {EvalMode::AggressiveChaser, EvalMode::MobilityRatio,
                                    EvalMode::Blend, EvalMode::OpenMove, EvalMode::Improved};

static Board boardFromPosition(const std::string& position) {
    Board board;
    EXPECT_TRUE(board.set_position(position)) << position;
    return board;
}

static double evalWith(const Board& board, Player p, EvalMode mode) {
    EvalParams params;
    params.mode = mode;
    return evaluate(board, p, params);
}

// Players in opposite corners of an otherwise empty 7x7 board: each has two
// jumps, taxicab distance 12, two of 49 cells occupied.
static const char* CornersPosition =
    "1....../......./......./......./......./......./......2 1";

// ============================================================
// Terminal shortcut
// ============================================================

TEST(EvalTest, StuckPlayerScoresNegativeInfinityInEveryMode) {
    // Player 1 in the corner with both jumps blocked; player 2 to move and free.
    Board board = boardFromPosition("1../..X/.X2 2");

    for (EvalMode mode : AllModes) {
        EXPECT_EQ(evalWith(board, Player1, mode), -ScoreInfinity) << eval_mode_name(mode);
    }
}

TEST(EvalTest, StuckOpponentScoresPositiveInfinityInEveryMode) {
    Board board = boardFromPosition("1../..X/.X2 2");

    for (EvalMode mode : AllModes) {
        EXPECT_EQ(evalWith(board, Player2, mode), ScoreInfinity) << eval_mode_name(mode);
    }
}

TEST(EvalTest, FinishedGameScoresForWinnerAndLoser) {
    // Player 2 to move with both jumps taken.
    Board board = boardFromPosition("XX./..1/2X. 2");

    for (EvalMode mode : AllModes) {
        EXPECT_EQ(evalWith(board, Player2, mode), -ScoreInfinity) << eval_mode_name(mode);
        EXPECT_EQ(evalWith(board, Player1, mode), ScoreInfinity) << eval_mode_name(mode);
    }
}

TEST(EvalTest, SideToMoveStuckOutranksOpponentStuck) {
    // Both players are stuck; the one to move has lost.
    Board board = boardFromPosition(".X./X1./..2 1");

    EXPECT_EQ(evalWith(board, Player1, EvalMode::Blend), -ScoreInfinity);
    EXPECT_EQ(evalWith(board, Player2, EvalMode::Blend), ScoreInfinity);
}

// ============================================================
// Heuristic terms
// ============================================================

TEST(EvalTest, OccupancyAndDistance) {
    Board board = boardFromPosition(CornersPosition);

    EXPECT_DOUBLE_EQ(occupancy_fraction(board), 2.0 / 49.0);
    EXPECT_EQ(taxicab_distance(board, Player1), 12);
    EXPECT_EQ(taxicab_distance(board, Player2), 12);

    Board empty;
    EXPECT_DOUBLE_EQ(occupancy_fraction(empty), 0.0);
    EXPECT_EQ(taxicab_distance(empty, Player1), 0);
}

TEST(EvalTest, BlendIsDefault) {
    Board board = boardFromPosition(CornersPosition);

    // 2 own + 12 distance - 2/49 occupancy - 2 opponent
    EXPECT_DOUBLE_EQ(evaluate(board, Player1, EvalParams()), 12.0 - 2.0 / 49.0);
    EXPECT_DOUBLE_EQ(evaluate_blend(board, Player1), 12.0 - 2.0 / 49.0);
}

TEST(EvalTest, AggressiveChaserWeightsOpponentMoves) {
    Board board = boardFromPosition(CornersPosition);

    EXPECT_DOUBLE_EQ(evalWith(board, Player1, EvalMode::AggressiveChaser), 2.0 - 2.0 * 2.0);

    EvalParams params;
    params.mode = EvalMode::AggressiveChaser;
    params.chaserWeight = 3.0;
    EXPECT_DOUBLE_EQ(evaluate(board, Player1, params), 2.0 - 3.0 * 2.0);
}

TEST(EvalTest, MobilityRatioScalesByOccupancy) {
    Board board = boardFromPosition(CornersPosition);

    EXPECT_DOUBLE_EQ(evalWith(board, Player1, EvalMode::MobilityRatio), 2.0 / (2.0 / 49.0));
}

TEST(EvalTest, MobilityRatioOnEmptyBoardIsUnscaled) {
    Board empty;

    double score = evalWith(empty, Player1, EvalMode::MobilityRatio);
    EXPECT_TRUE(std::isfinite(score));
    EXPECT_DOUBLE_EQ(score, 49.0);
}

TEST(EvalTest, BaselineModes) {
    Board board;
    board.make_move(make_move(0, 0));
    board.make_move(make_move(3, 3));

    // Player 1 in the corner has 2 jumps, player 2 in the center has 8.
    EXPECT_DOUBLE_EQ(evalWith(board, Player1, EvalMode::OpenMove), 2.0);
    EXPECT_DOUBLE_EQ(evalWith(board, Player1, EvalMode::Improved), -6.0);
    EXPECT_DOUBLE_EQ(evalWith(board, Player2, EvalMode::Improved), 6.0);
}

TEST(EvalTest, EvaluateDoesNotModifyBoard) {
    Board board = boardFromPosition(CornersPosition);
    const std::string before = board.to_position();

    for (EvalMode mode : AllModes) evalWith(board, Player1, mode);

    EXPECT_EQ(board.to_position(), before);
}

// ============================================================
// Mode registry
// ============================================================

TEST(EvalTest, ParseEvalModeAcceptsNamesAndAliases) {
    EvalMode mode = EvalMode::Blend;

    ASSERT_TRUE(parse_eval_mode("chaser", mode));
    EXPECT_EQ(mode, EvalMode::AggressiveChaser);
    ASSERT_TRUE(parse_eval_mode("MOBILITYRATIO", mode));
    EXPECT_EQ(mode, EvalMode::MobilityRatio);
    ASSERT_TRUE(parse_eval_mode("open", mode));
    EXPECT_EQ(mode, EvalMode::OpenMove);
    ASSERT_TRUE(parse_eval_mode("Blend", mode));
    EXPECT_EQ(mode, EvalMode::Blend);
}

TEST(EvalTest, ParseEvalModeRejectsUnknownNames) {
    EvalMode mode = EvalMode::Improved;

    EXPECT_FALSE(parse_eval_mode("neural", mode));
    EXPECT_FALSE(parse_eval_mode("", mode));
    EXPECT_EQ(mode, EvalMode::Improved);
}

TEST(EvalTest, ModeNamesRoundTrip) {
    for (EvalMode mode : AllModes) {
        EvalMode parsed = mode == EvalMode::Blend ? EvalMode::Improved : EvalMode::Blend;
        ASSERT_TRUE(parse_eval_mode(eval_mode_name(mode), parsed));
        EXPECT_EQ(parsed, mode);
    }
}
