// ========================= src/core/Generator.hpp =========================
#pragma once
#include "Solver.hpp"
#include <optional>

namespace wss {

    struct GenOptions {
        int numColors{ 5 };
        int reservedEmpty{ 2 };     // tubes left empty in the deal
        int maxRunPerTube{ 2 };     // longest same-color run allowed while dealing, 0 = no limit
        uint64_t seed{ 0xA17C3B5ECAFEBEEFULL };
        int attempts{ 30 };         // deals tried per makeOne
        bool validate{ true };      // keep only deals the solver finishes
        SolveOptions solve{};       // validation solver settings
    };

    struct Generated {
        State state;
        SolveResult result;         // validation result (outcome Unsolvable + empty when not validated)
        int attempt{ 0 };
    };

    class Generator {
    public:
        Generator(Params p, GenOptions opt);

        // One random deal; when validation is on, only a solved one is returned.
        std::optional<Generated> makeOne();

        // Deal without validation.
        State createRandomMixed();

        // Colors needed vs. space available; false with a reason when the deal cannot fit.
        bool checkParams(std::string* why = nullptr) const;

    private:
        Params p; GenOptions opt; RNG rng;
    };

} // namespace wss
