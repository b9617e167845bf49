#include <gtest/gtest.h>

#include "TestPuzzles.hpp"
#include "core/Replay.hpp"
#include "tools/Batch.hpp"

using namespace wss;
using namespace wss::testing;

namespace {

SolveResult withOutcome(SolveOutcome o) {
    SolveResult res;
    res.outcome = o;
    return res;
}

}  // namespace

// ─── Exit codes ─────────────────────────────────────────────────

TEST(BatchTest, OutcomesMapToExitCodes) {
    EXPECT_EQ(exitCodeFor(withOutcome(SolveOutcome::Solved), true), kExitSolved);
    EXPECT_EQ(exitCodeFor(withOutcome(SolveOutcome::Unsolvable), false), kExitUnsolvable);
    EXPECT_EQ(exitCodeFor(withOutcome(SolveOutcome::BudgetExhausted), false), kExitBudget);
    EXPECT_EQ(exitCodeFor(withOutcome(SolveOutcome::InvalidInput), false), kExitInvalid);
}

TEST(BatchTest, SolvedButUnverifiedIsAFailure) {
    State start = makeState(4, alternatingPair());
    SolveResult res = withOutcome(SolveOutcome::Solved);
    res.moves = { {0, 2, 1} };  // legal, but leaves the puzzle unsolved
    const bool verified = verifySolution(start, res.moves, res.pour);
    EXPECT_FALSE(verified);
    EXPECT_EQ(exitCodeFor(res, verified), kExitUnverified);
    EXPECT_NE(exitCodeFor(res, verified), kExitSolved);
}

TEST(BatchTest, WorstCodeWins) {
    int worst = kExitSolved;
    for (int code : {kExitUnsolvable, kExitSolved, kExitBudget, kExitUnsolvable}) worst = worseExit(worst, code);
    EXPECT_EQ(worst, kExitBudget);
    EXPECT_EQ(worseExit(kExitBudget, kExitInvalid), kExitInvalid);
    EXPECT_EQ(worseExit(kExitInvalid, kExitUnverified), kExitUnverified);
    EXPECT_EQ(worseExit(kExitUnverified, kExitSolved), kExitUnverified);
}

// ─── Limits ─────────────────────────────────────────────────────

TEST(BatchTest, NegativeLimitsAreRejected) {
    std::string why;
    EXPECT_TRUE(checkLimits(0, 0, &why));
    EXPECT_TRUE(checkLimits(1000000, 250, &why));

    EXPECT_FALSE(checkLimits(-1, 0, &why));
    EXPECT_NE(why.find("--max-states"), std::string::npos);
    EXPECT_FALSE(checkLimits(10, -5, &why));
    EXPECT_NE(why.find("--time-ms"), std::string::npos);
}
