#include <gtest/gtest.h>

#include "TestPuzzles.hpp"
#include "core/Replay.hpp"
#include "core/Solver.hpp"

using namespace wss;
using namespace wss::testing;

TEST(ReplayTest, ReproducesEveryIntermediateState) {
    State start = makeState(4, alternatingPair());
    const State copy = start;
    const std::vector<Move> moves{{0, 2}, {0, 3}, {0, 2}, {1, 0}, {1, 2}, {1, 0}};

    ReplayResult r = replay(start, moves, PourPolicy::AllOrNothing);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.states.size(), moves.size() + 1);
    EXPECT_EQ(r.applied.size(), moves.size());
    EXPECT_EQ(r.states.front(), start);
    EXPECT_TRUE(r.last().isSolved());
    EXPECT_EQ(start, copy);  // the initial state is never touched

    // after the first move tube 2 holds the blue unit poured off tube 0
    EXPECT_EQ(r.states[1].T[2].units, (std::vector<Color>{2}));
    EXPECT_EQ(r.states[1].T[0].size(), 3);
}

TEST(ReplayTest, RecomputesTransferredAmount) {
    State start = makeState(4, {{"a", "b", "b"}, {"c", "c", "b"}});
    ReplayResult r = replay(start, {{0, 1, 99}}, PourPolicy::Partial);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.applied[0].amount, 1);
    EXPECT_EQ(r.last().T[0].size(), 2);
    EXPECT_EQ(r.last().T[1].size(), 4);
}

TEST(ReplayTest, StopsAtIllegalMove) {
    State start = makeState(4, alternatingPair());
    ReplayResult r = replay(start, {{0, 2}, {0, 1}}, PourPolicy::AllOrNothing);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.failedStep, 1);
    EXPECT_EQ(r.states.size(), 2u);
    EXPECT_NE(r.error.find("illegal"), std::string::npos);
}

TEST(ReplayTest, RejectsBadIndices) {
    State start = makeState(4, alternatingPair());
    EXPECT_FALSE(replay(start, {{0, 4}}, PourPolicy::Partial).ok);
    EXPECT_FALSE(replay(start, {{-1, 2}}, PourPolicy::Partial).ok);
    ReplayResult same = replay(start, {{2, 2}}, PourPolicy::Partial);
    EXPECT_FALSE(same.ok);
    EXPECT_EQ(same.failedStep, 0);
}

TEST(ReplayTest, VerifyRequiresSolvedEnd) {
    State start = makeState(4, alternatingPair());
    std::string err;
    EXPECT_FALSE(verifySolution(start, {{0, 2}}, PourPolicy::AllOrNothing, &err));
    EXPECT_NE(err.find("not solved"), std::string::npos);
    EXPECT_TRUE(verifySolution(start, {{0, 2}, {0, 3}, {0, 2}, {1, 0}, {1, 2}, {1, 0}}, PourPolicy::AllOrNothing));
}

TEST(ReplayTest, SolverOutputReplaysUnderBothModes) {
    State start = makeState(4, fiveColorPuzzle());
    for (auto mode : {SearchMode::BreadthFirst, SearchMode::BestFirst}) {
        SolveOptions opt;
        opt.mode = mode;
        SolveResult res = Solver(opt).solve(start);
        ASSERT_TRUE(res.solved());
        ReplayResult r = replay(start, res.moves, opt.pour);
        ASSERT_TRUE(r.ok) << r.error;
        EXPECT_TRUE(r.last().isSolved());
        for (size_t i = 0; i < res.moves.size(); ++i) EXPECT_EQ(r.applied[i], res.moves[i]);
    }
}
