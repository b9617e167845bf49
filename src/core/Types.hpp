// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>

namespace wss {

    using Color = uint8_t;          // 0 = no color, 1..254 interned colors

    constexpr Color kNoColor = 0;
    constexpr int kMaxColors = 254;

    // Tubes hold only real colors; capacity lives in Params (uniform per puzzle).
    struct Tube {
        std::vector<Color> units;   // bottom -> top order

        int size() const { return static_cast<int>(units.size()); }
        bool isEmpty() const { return units.empty(); }
        bool isFull(int capacity) const { return size() >= capacity; }

        Color topColor() const { return units.empty() ? kNoColor : units.back(); }
        Color bottomColor() const { return units.empty() ? kNoColor : units.front(); }

        // count of contiguous same-color units from top (pourable block)
        int blockSize() const {
            if (units.empty()) return 0;
            Color t = units.back();
            int cnt = 0;
            for (int i = size() - 1; i >= 0; --i) {
                if (units[i] == t) ++cnt; else break;
            }
            return cnt;
        }

        // empty or a single color, regardless of fill level
        bool isSettled() const { return blockSize() == size(); }

        bool operator==(const Tube& o) const { return units == o.units; }
        bool operator!=(const Tube& o) const { return !(*this == o); }
    };

    struct Move { int from{ -1 }; int to{ -1 }; int amount{ 0 }; }; // amount = units moved

    inline bool operator==(const Move& a, const Move& b) { return a.from == b.from && a.to == b.to && a.amount == b.amount; }
    inline bool operator!=(const Move& a, const Move& b) { return !(a == b); }

    struct Params {
        int numTubes{ 4 };      // total stacks, >= 2
        int capacity{ 4 };      // units per tube, >= 1
    };

    // How much of the pourable block a move transfers.
    enum class PourPolicy : uint8_t {
        AllOrNothing = 0,   // only when the whole block fits
        Partial = 1         // as much as the destination can take
    };

    enum class SearchMode : uint8_t {
        BreadthFirst = 0,   // shortest move count
        BestFirst = 1       // A*-style, g + heuristic
    };

    inline const char* toString(PourPolicy p) { return p == PourPolicy::Partial ? "partial" : "all"; }
    inline const char* toString(SearchMode m) { return m == SearchMode::BestFirst ? "astar" : "bfs"; }

} // namespace wss
