#pragma once

#include "core/Puzzle.hpp"

#include <gtest/gtest.h>

namespace wss::testing {

using Tokens = std::vector<std::vector<std::string>>;

inline PuzzleInput input(int capacity, const Tokens& tubes) {
    PuzzleInput in;
    in.totalTubes = static_cast<int>(tubes.size());
    in.capacity = capacity;
    in.tubes = tubes;
    return in;
}

// Builds a validated state; fails the current test on rejection.
inline State makeState(int capacity, const Tokens& tubes, Palette* palette = nullptr) {
    Palette local;
    Palette& pal = palette ? *palette : local;
    State s;
    std::string err;
    EXPECT_TRUE(buildState(input(capacity, tubes), pal, s, &err)) << err;
    return s;
}

// Two colors, two empties: [[r,b,r,b],[b,r,b,r],[],[]]
inline Tokens alternatingPair() {
    return { {"red", "blue", "red", "blue"}, {"blue", "red", "blue", "red"}, {}, {} };
}

// Three colors rotated over three tubes of capacity 3, two empties.
inline Tokens rotatedTriple() {
    return { {"a", "b", "c"}, {"b", "c", "a"}, {"c", "a", "b"}, {}, {} };
}

// Five colors, seven tubes, capacity 4.
inline Tokens fiveColorPuzzle() {
    return {
        {"orange", "pink", "green", "pink"},
        {"orange", "red", "red", "blue"},
        {"blue", "green", "red", "red"},
        {"pink", "red", "orange", "orange"},
        {"green", "orange", "pink", "blue"},
        {},
        {},
    };
}

// Ten colors, two empties, capacity 4: a search space far beyond a few thousand states.
inline Tokens tenColorPuzzle() {
    return {
        {"c4", "c1", "c5", "c4"}, {"c5", "c5", "c1", "c2"}, {"c6", "c6", "c8", "c3"},
        {"c9", "c2", "c3", "c0"}, {"c6", "c9", "c8", "c0"}, {"c7", "c4", "c0", "c1"},
        {"c2", "c3", "c0", "c1"}, {"c6", "c4", "c5", "c7"}, {"c9", "c2", "c3", "c8"},
        {"c9", "c7", "c8", "c7"}, {}, {},
    };
}

// Four colors, one empty, capacity 4. Best-first search first reaches some
// states through longer paths and must reopen them to stay at 12 moves.
inline Tokens reopenedShortcut() {
    return { {"b", "c", "b", "d"}, {"a", "d", "a", "c"}, {"c", "c", "d", "b"}, {"a", "d", "b", "a"}, {} };
}

// Capacity 4; reachable only when pours may be split.
inline Tokens needsPartialPours() {
    return { {"a", "a"}, {"b", "b", "c", "a"}, {"a", "c", "c"}, {"b", "b", "c"} };
}

}  // namespace wss::testing
