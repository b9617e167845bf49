// ========================= src/core/State.hpp =========================
#pragma once
#include "Types.hpp"
#include <map>

namespace wss {

    struct State {
        Params p;
        std::vector<Tube> T; // size = p.numTubes

        // construction helper (no validation; see Puzzle.hpp for checked input)
        static State fromTubes(int capacity, const std::vector<std::vector<Color>>& tubes);

        // move legality under the given pour policy; amount = units transferred
        bool canPour(int from, int to, PourPolicy policy, int* outAmount = nullptr) const;
        // pouring a settled tube wholesale into an empty one only relabels tubes
        bool isUseful(int from, int to) const;
        void apply(const Move& m);

        // legal and useful moves, from = 0..n-1, to = 0..n-1
        std::vector<Move> legalMoves(PourPolicy policy) const;

        bool isSolved() const;
        int emptyCount() const;
        std::map<Color, int> colorCounts() const;

        // canonical structural key: units joined by ',', tubes by '|'
        std::string key() const;
        size_t hash() const; // FNV-style cheap hash

        bool operator==(const State& o) const { return p.capacity == o.p.capacity && T == o.T; }
        bool operator!=(const State& o) const { return !(*this == o); }
    };

    struct RNG { uint64_t s = 0x9E3779B97F4A7C15ULL; uint64_t next(); int irange(int lo, int hi); };

} // namespace wss
