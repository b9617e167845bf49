// ========================= src/core/Replay.hpp =========================
#pragma once
#include "State.hpp"

namespace wss {

    struct ReplayResult {
        bool ok{ false };
        std::vector<State> states;   // initial state plus one per applied move
        std::vector<Move> applied;   // moves with the amount actually transferred
        int failedStep{ -1 };        // 0-based index of the rejected move
        std::string error;

        const State& last() const { return states.back(); }
    };

    // Re-derive every intermediate state of a move list. Moves are re-checked
    // against canPour; their stored amount is ignored and recomputed.
    ReplayResult replay(const State& initial, const std::vector<Move>& moves, PourPolicy policy);

    // Replay succeeds, ends solved, and colors/capacity hold at every step.
    bool verifySolution(const State& initial, const std::vector<Move>& moves, PourPolicy policy, std::string* error = nullptr);

} // namespace wss
