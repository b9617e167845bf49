// ========================= src/tools/Batch.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include <string>

namespace wss {

    // Process exit codes of wss_solve; a batch exits with the worst one seen.
    enum ExitCode : int {
        kExitSolved = 0,
        kExitUsage = 1,         // bad flags, unreadable or unwritable file
        kExitInvalid = 2,
        kExitUnsolvable = 3,
        kExitBudget = 4,
        kExitUnverified = 5     // solver returned moves that do not replay to a solved state
    };

    int exitCodeFor(const SolveResult& res, bool verified);

    // unverified > invalid > budget > unsolvable > solved; usage errors never reach here
    int worseExit(int a, int b);

    // Search limits from the command line: negative values are rejected, 0 = unlimited.
    bool checkLimits(int64_t maxStates, int timeBudgetMs, std::string* why = nullptr);

} // namespace wss
