#include <gtest/gtest.h>

#include "core/Generator.hpp"
#include "core/Replay.hpp"

using namespace wss;

namespace {

Params geometry(int tubes, int capacity) {
    Params p;
    p.numTubes = tubes;
    p.capacity = capacity;
    return p;
}

}  // namespace

TEST(GeneratorTest, DealUsesEveryColorExactlyCapacityTimes) {
    GenOptions opt;
    opt.numColors = 5;
    opt.reservedEmpty = 2;
    opt.seed = 99;
    Generator gen(geometry(7, 4), opt);
    State s = gen.createRandomMixed();

    ASSERT_EQ(s.T.size(), 7u);
    EXPECT_TRUE(s.T[5].isEmpty());
    EXPECT_TRUE(s.T[6].isEmpty());
    const auto counts = s.colorCounts();
    ASSERT_EQ(counts.size(), 5u);
    for (const auto& kv : counts) EXPECT_EQ(kv.second, 4);
    for (const auto& t : s.T) EXPECT_LE(t.size(), 4);
}

TEST(GeneratorTest, SameSeedSameDeal) {
    GenOptions opt;
    opt.seed = 1234;
    Generator a(geometry(7, 4), opt);
    Generator b(geometry(7, 4), opt);
    EXPECT_EQ(a.createRandomMixed(), b.createRandomMixed());
    EXPECT_EQ(a.createRandomMixed(), b.createRandomMixed());
}

TEST(GeneratorTest, ValidatedDealIsSolvable) {
    GenOptions opt;
    opt.numColors = 3;
    opt.seed = 42;
    opt.solve.maxStates = 100000;
    Generator gen(geometry(5, 3), opt);
    auto g = gen.makeOne();
    ASSERT_TRUE(g.has_value());
    EXPECT_TRUE(g->result.solved());
    EXPECT_TRUE(verifySolution(g->state, g->result.moves, opt.solve.pour));
}

TEST(GeneratorTest, RejectsImpossibleGeometry) {
    GenOptions opt;
    opt.numColors = 6;
    opt.reservedEmpty = 2;
    Generator gen(geometry(7, 4), opt);
    std::string why;
    EXPECT_FALSE(gen.checkParams(&why));
    EXPECT_FALSE(why.empty());
    EXPECT_FALSE(gen.makeOne().has_value());
}
