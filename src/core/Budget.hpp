// ========================= src/core/Budget.hpp =========================
#pragma once
#include <chrono>
#include <cstdint>

namespace wss {

    // Search effort limits for one solve call. 0 disables a limit.
    class SearchBudget {
    public:
        SearchBudget(int64_t maxStates, int timeBudgetMs) :maxStates(maxStates), budgetMs(timeBudgetMs) {}

        void start() { t0 = clock::now(); }

        double elapsedMs() const {
            return std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        }

        bool statesExhausted(int64_t distinctStates) const { return maxStates > 0 && distinctStates > maxStates; }
        bool timeExhausted() const { return budgetMs > 0 && elapsedMs() >= budgetMs; }

    private:
        using clock = std::chrono::steady_clock;
        int64_t maxStates{ 0 };
        int budgetMs{ 0 };
        clock::time_point t0{ clock::now() };
    };

} // namespace wss
