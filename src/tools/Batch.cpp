// ========================= src/tools/Batch.cpp =========================
#include "Batch.hpp"

namespace wss {

    int exitCodeFor(const SolveResult& res, bool verified) {
        switch (res.outcome) {
        case SolveOutcome::Solved: return verified ? kExitSolved : kExitUnverified;
        case SolveOutcome::Unsolvable: return kExitUnsolvable;
        case SolveOutcome::BudgetExhausted: return kExitBudget;
        case SolveOutcome::InvalidInput: return kExitInvalid;
        }
        return kExitUsage;
    }

    static int severity(int code) {
        switch (code) {
        case kExitUnverified: return 4;
        case kExitInvalid: return 3;
        case kExitBudget: return 2;
        case kExitUnsolvable: return 1;
        default: return 0;
        }
    }

    int worseExit(int a, int b) {
        return severity(b) > severity(a) ? b : a;
    }

    bool checkLimits(int64_t maxStates, int timeBudgetMs, std::string* why) {
        if (maxStates < 0) {
            if (why) *why = "--max-states must be 0 (unlimited) or positive, got " + std::to_string(maxStates);
            return false;
        }
        if (timeBudgetMs < 0) {
            if (why) *why = "--time-ms must be 0 (unlimited) or positive, got " + std::to_string(timeBudgetMs);
            return false;
        }
        return true;
    }

} // namespace wss
