#include <gtest/gtest.h>

#include "TestPuzzles.hpp"
#include "core/Palette.hpp"
#include "core/Puzzle.hpp"

using namespace wss;
using namespace wss::testing;

// ─── Palette ───────────────────────────────────────────────────

TEST(PaletteTest, InternsInFirstSeenOrder) {
    Palette pal;
    EXPECT_EQ(pal.intern("red"), 1);
    EXPECT_EQ(pal.intern("blue"), 2);
    EXPECT_EQ(pal.intern("red"), 1);
    EXPECT_EQ(pal.size(), 2);
    EXPECT_EQ(pal.name(2), "blue");
    EXPECT_EQ(pal.name(9), "?");
    EXPECT_EQ(pal.find("green"), kNoColor);
    EXPECT_EQ(pal.intern(""), kNoColor);
}

TEST(PaletteTest, RefusesColorsBeyondLimit) {
    Palette pal = Palette::numbered(kMaxColors);
    EXPECT_EQ(pal.size(), kMaxColors);
    EXPECT_EQ(pal.intern("one-too-many"), kNoColor);
    EXPECT_EQ(pal.intern("c1"), 1);
}

// ─── Validation ────────────────────────────────────────────────

TEST(PuzzleTest, BuildsStateFromTokens) {
    Palette pal;
    State s;
    std::string err;
    ASSERT_TRUE(buildState(input(4, alternatingPair()), pal, s, &err)) << err;
    EXPECT_EQ(s.p.numTubes, 4);
    EXPECT_EQ(s.p.capacity, 4);
    EXPECT_EQ(s.T[0].units, (std::vector<Color>{1, 2, 1, 2}));
    EXPECT_TRUE(s.T[3].isEmpty());
    EXPECT_EQ(s.emptyCount(), 2);
}

TEST(PuzzleTest, RejectsTubeOverCapacity) {
    Palette pal;
    State s;
    std::string err;
    EXPECT_FALSE(buildState(input(3, {{"a", "a", "a", "a"}, {}}), pal, s, &err));
    EXPECT_NE(err.find("capacity"), std::string::npos);
    EXPECT_EQ(pal.size(), 0);  // rejected input leaves the palette alone
}

TEST(PuzzleTest, RejectsStructuralMismatches) {
    Palette pal;
    State s;

    PuzzleInput tooFew = input(4, {{"a"}});
    EXPECT_FALSE(buildState(tooFew, pal, s));

    PuzzleInput badCapacity = input(0, {{}, {}});
    EXPECT_FALSE(buildState(badCapacity, pal, s));

    PuzzleInput countMismatch = input(4, {{"a"}, {"a"}});
    countMismatch.totalTubes = 3;
    EXPECT_FALSE(buildState(countMismatch, pal, s));

    PuzzleInput blankToken = input(4, {{"a", ""}, {}});
    EXPECT_FALSE(buildState(blankToken, pal, s));
}

TEST(PuzzleTest, DeclaredEmptyCountMustMatch) {
    Palette pal;
    State s;
    PuzzleInput in = input(4, alternatingPair());
    in.emptyTubes = 2;
    EXPECT_TRUE(buildState(in, pal, s));
    in.emptyTubes = 1;
    std::string err;
    EXPECT_FALSE(buildState(in, pal, s, &err));
    EXPECT_NE(err.find("empty"), std::string::npos);
}

// ─── Reporting ─────────────────────────────────────────────────

TEST(PuzzleTest, ToInputRestoresTokens) {
    Palette pal;
    State s = makeState(4, fiveColorPuzzle(), &pal);
    PuzzleInput back = toInput(s, pal);
    EXPECT_EQ(back.tubes, fiveColorPuzzle());
    EXPECT_EQ(back.emptyTubes, 2);
}

TEST(PuzzleTest, DescribeListsTubes) {
    Palette pal;
    State s = makeState(4, {{"red", "blue"}, {}}, &pal);
    EXPECT_EQ(describe(s, pal), "Tube 0: red blue\nTube 1: [empty]\n");
}

TEST(PuzzleTest, DescribeMoveNamesColorAndAmount) {
    Palette pal;
    State s = makeState(4, {{"red", "blue", "blue"}, {"blue"}, {}}, &pal);
    EXPECT_EQ(describeMove(s, Move{0, 2, 2}, pal), "Pouring 2 unit(s) of 'blue' from Tube 0 to Tube 2");
    s.apply(Move{0, 2, 2});
    EXPECT_EQ(describeMove(s, Move{0, 1, 1}, pal), "Pouring 1 unit(s) of 'red' from Tube 0 to Tube 1");
}

TEST(PuzzleTest, WarnsAboutIncompleteColors) {
    Palette pal;
    State s = makeState(4, {{"red", "red", "red"}, {"blue", "blue", "blue", "blue"}, {}}, &pal);
    auto warnings = colorWarnings(s, pal);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("red"), std::string::npos);
}
