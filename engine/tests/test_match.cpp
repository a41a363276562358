#include <gtest/gtest.h>

#include <string>

#include "../agent.h"
#include "../attacks.h"
#include "../board.h"
#include "../match.h"
#include "../movegen.h"

using namespace isolation;

class MatchTestEnvironment : public ::testing::Environment {
   public:
    void SetUp() override {
        attacks::init();
    }
};

static double noDeadline() {
    return 1e9;
}

// Always answers with a move that is never legal.
class ForfeitingAgent : public Agent {
   public:
    std::string name() const override {
        return "Forfeit";
    }
    Move get_move(const Board&, const MoveList&, const TimeLeftFn&) override {
        return NoMove;
    }
};

// Burns its whole clock before answering.
class SlowAgent : public Agent {
   public:
    std::string name() const override {
        return "Slow";
    }
    Move get_move(const Board&, const MoveList& legalMoves, const TimeLeftFn& timeLeft) override {
        while (timeLeft() > 0.0) {
        }
        return legalMoves[0];
    }
};

static SearchConfig shallowAlphaBeta() {
    SearchConfig config;
    config.method = SearchMethod::AlphaBeta;
    config.maxDepth = 3;
    return config;
}

// ============================================================
// Agents
// ============================================================

TEST(AgentTest, RandomAgentPicksLegalMove) {
    Board board;
    board.make_move(make_move(3, 3));
    board.make_move(make_move(0, 0));
    MoveList legal = generate_legal(board);

    RandomAgent agent(7);
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(legal.contains(agent.get_move(board, legal, noDeadline)));
    }

    MoveList empty;
    EXPECT_EQ(agent.get_move(board, empty, noDeadline), NoMove);
}

TEST(AgentTest, GreedyAgentTakesWinningJump) {
    // Player 2 in the corner has one jump left, (2,1). Player 1 can reach
    // (1,0), (2,1) or (2,3) and only the second strands player 2.
    Board board;
    ASSERT_TRUE(board.set_position("2.1./..X./..../.... 1"));
    MoveList legal = generate_legal(board);
    ASSERT_EQ(legal.size(), 3);

    GreedyAgent agent;
    EXPECT_EQ(agent.get_move(board, legal, noDeadline), make_move(2, 1));
}

TEST(AgentTest, SearchAgentRecordsStats) {
    Board board;
    board.make_move(make_move(3, 3));
    board.make_move(make_move(2, 4));
    MoveList legal = generate_legal(board);

    SearchAgent agent(shallowAlphaBeta());
    Move m = agent.get_move(board, legal, noDeadline);

    EXPECT_TRUE(legal.contains(m));
    EXPECT_GE(agent.last_stats().depthReached, 1);
    EXPECT_GT(agent.last_stats().nodes, 0u);
    EXPECT_EQ(agent.name(), "AlphaBeta/Blend");
    EXPECT_EQ(SearchAgent().name(), "Minimax/Blend");
}

// ============================================================
// Matches
// ============================================================

TEST(MatchTest, SearchAgentPlaysGameToTheEnd) {
    SearchAgent agent(shallowAlphaBeta());
    RandomAgent opponent(3);

    MatchResult result = play_match(Board(5, 5), agent, opponent, 2000);

    ASSERT_EQ(result.outcome, GameOutcome::NoLegalMoves);
    EXPECT_TRUE(is_game_over(result.finalBoard));
    EXPECT_EQ(result.winner, ~result.finalBoard.side_to_move());

    // Replaying the history reproduces the final board
    Board replay(5, 5);
    for (Move m : result.history) {
        ASSERT_TRUE(generate_legal(replay).contains(m)) << move_to_str(m);
        replay.make_move(m);
    }
    EXPECT_EQ(replay.to_position(), result.finalBoard.to_position());
}

TEST(MatchTest, IllegalAnswerLosesImmediately) {
    ForfeitingAgent forfeit;
    RandomAgent opponent;

    MatchResult result = play_match(Board(), forfeit, opponent, 1000);

    EXPECT_EQ(result.outcome, GameOutcome::IllegalMove);
    EXPECT_EQ(result.winner, Player2);
    EXPECT_TRUE(result.history.empty());
}

TEST(MatchTest, LateAnswerLosesOnTime) {
    RandomAgent opponent;
    SlowAgent slow;

    MatchResult result = play_match(Board(), opponent, slow, 5);

    EXPECT_EQ(result.outcome, GameOutcome::Timeout);
    EXPECT_EQ(result.winner, Player1);
    EXPECT_EQ(result.history.size(), 1u);
}

TEST(MatchTest, FinishedBoardEndsWithoutAsking) {
    Board board;
    ASSERT_TRUE(board.set_position("XX./..1/2X. 2"));
    ForfeitingAgent first;
    ForfeitingAgent second;

    MatchResult result = play_match(board, first, second, 1000);

    EXPECT_EQ(result.outcome, GameOutcome::NoLegalMoves);
    EXPECT_EQ(result.winner, Player1);
    EXPECT_TRUE(result.history.empty());
}

TEST(MatchTest, TournamentCountsEveryGame) {
    SearchAgent agent(shallowAlphaBeta());
    RandomAgent opponent(11);

    TournamentResult tally = run_tournament(agent, opponent, 2, 2000, 5, 5);

    EXPECT_EQ(tally.wins + tally.losses, 2);
    EXPECT_LE(tally.timeouts, tally.losses);
}

TEST(MatchTest, OutcomeNames) {
    EXPECT_STREQ(outcome_name(GameOutcome::NoLegalMoves), "no legal moves");
    EXPECT_STREQ(outcome_name(GameOutcome::Timeout), "timeout");
    EXPECT_STREQ(outcome_name(GameOutcome::IllegalMove), "illegal move");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new MatchTestEnvironment());
    return RUN_ALL_TESTS();
}
