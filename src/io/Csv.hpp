// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include <string>
#include <vector>

namespace wss {

    struct CsvRow {
        int index{ 0 };             // puzzle number
        std::string map;            // e.g. red_blue_red_blue#blue_red_blue_red##, "dark_blue" stored as dark%5Fblue
        int NumberOfColor{ 0 };
        int NumberOfSlot{ 0 };      // capacity
        int NumberOfStack{ 0 };     // tubes
        int EmptyStack{ -1 };       // -1 = not declared
        std::string Outcome;        // solved | unsolvable | budget | invalid | ""
        int MinMoves{ -1 };
        std::string Solution;       // e.g. "0>2 1>3 1>2"
    };

    struct CsvIO {
        static CsvRow encode(int index, const PuzzleInput& in, const SolveResult* result = nullptr);
        static CsvRow encode(int index, const State& s, const Palette& palette, const SolveResult* result = nullptr);
        // structural decode only; the result still goes through buildState
        static bool decode(const CsvRow& row, PuzzleInput& out, std::string* error = nullptr);

        static std::string encodeMoves(const std::vector<Move>& moves);
        static bool decodeMoves(const std::string& text, std::vector<Move>& out, std::string* error = nullptr);

        static bool save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists = true, std::string* error = nullptr);
        // malformed rows are skipped; a note per skipped row goes to *skipped
        static bool load(const std::string& path, std::vector<CsvRow>& out, std::vector<std::string>* skipped = nullptr, std::string* error = nullptr);
    };

} // namespace wss
