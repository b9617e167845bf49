// ========================= src/core/Solver.hpp =========================
#pragma once
#include "Puzzle.hpp"
#include <functional>

namespace wss {

    enum class SolveOutcome : uint8_t {
        Solved = 0,
        Unsolvable = 1,      // frontier exhausted, no solved state reachable
        BudgetExhausted = 2, // state or time limit hit first; solvability unknown
        InvalidInput = 3     // rejected before searching
    };

    const char* toString(SolveOutcome o);

    struct SearchProgress {
        int64_t iterations{ 0 };   // states dequeued so far
        int64_t frontier{ 0 };
        int64_t distinctStates{ 0 };
        double elapsedMs{ 0.0 };
    };

    struct SolveOptions {
        SearchMode mode{ SearchMode::BreadthFirst };
        PourPolicy pour{ PourPolicy::AllOrNothing };
        int64_t maxStates{ 1000000 };  // distinct states recorded, 0 = unlimited
        int timeBudgetMs{ 0 };         // 0 = unlimited
        int progressInterval{ 10000 }; // dequeues between onProgress calls
        std::function<void(const SearchProgress&)> onProgress;
    };

    struct SolveResult {
        SolveOutcome outcome{ SolveOutcome::Unsolvable };
        std::vector<Move> moves;        // only meaningful when solved
        int64_t statesVisited{ 0 };     // distinct canonical states recorded
        int64_t statesExpanded{ 0 };    // states dequeued
        double elapsedMs{ 0.0 };
        std::string message;            // reason for InvalidInput / which budget tripped
        PourPolicy pour{ PourPolicy::AllOrNothing }; // moves replay only under this policy

        bool solved() const { return outcome == SolveOutcome::Solved; }
        // solved or proven unsolvable
        bool isFinal() const { return outcome == SolveOutcome::Solved || outcome == SolveOutcome::Unsolvable; }
    };

    // Broken color runs plus duplicated bottom colors. Not admissible.
    int heuristic(const State& s);

    // One instance per puzzle; all search state is local to solve().
    class Solver {
    public:
        explicit Solver(SolveOptions options = {}) :opt(std::move(options)) {}

        SolveResult solve(const State& start) const;
        // validates first; InvalidInput without searching on failure
        SolveResult solve(const PuzzleInput& input, Palette& palette) const;

        const SolveOptions& options() const { return opt; }

    private:
        SolveOptions opt;

        SolveResult breadthFirst(const State& start) const;
        SolveResult bestFirst(const State& start) const;
    };

} // namespace wss
