// ========================= src/core/Puzzle.hpp =========================
#pragma once
#include "State.hpp"
#include "Palette.hpp"

namespace wss {

    // Puzzle as delivered by the capture side: tokens bottom -> top per tube.
    struct PuzzleInput {
        int totalTubes{ 0 };
        int capacity{ 4 };
        std::vector<std::vector<std::string>> tubes;
        int emptyTubes{ -1 }; // declared empty tube count, -1 = not declared
    };

    // Validate structural invariants and convert into a searchable State.
    // On failure outState is untouched and *error holds the reason.
    bool buildState(const PuzzleInput& in, Palette& palette, State& outState, std::string* error = nullptr);

    // Inverse of buildState for reporting / saving.
    PuzzleInput toInput(const State& s, const Palette& palette);

    // "Tube i: a b c" lines, 0-based tube indices
    std::string describe(const State& s, const Palette& palette);

    // "Pouring 2 unit(s) of 'red' from Tube 0 to Tube 3"; before = state the move applies to
    std::string describeMove(const State& before, const Move& m, const Palette& palette);

    // Colors whose unit total differs from capacity (usually a capture mistake).
    std::vector<std::string> colorWarnings(const State& s, const Palette& palette);

} // namespace wss
