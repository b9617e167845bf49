// ========================= src/tools/solve_main.cpp =========================
// Batch solver: reads puzzles from CSV (or deals random ones), solves each
// and optionally writes the rows back out with outcome and solution.
#include "../core/Generator.hpp"
#include "../core/Replay.hpp"
#include "../io/Csv.hpp"
#include "Batch.hpp"
#include "../util/Log.hpp"

#include <iostream>

#include "cxxopts.hpp"

namespace {

    struct Job { int index; wss::PuzzleInput input; };

    // one line per pour, then the solved state
    void traceSolution(int index, const wss::State& start, const wss::Palette& palette, const wss::SolveResult& res) {
        wss::ReplayResult r = wss::replay(start, res.moves, res.pour);
        for (size_t i = 0; i < r.applied.size(); ++i)
            wss::log::debug("puzzle {}: [Move {}] {}", index, i + 1, wss::describeMove(r.states[i], r.applied[i], palette));
        wss::log::debug("puzzle {} final state:\n{}", index, wss::describe(r.last(), palette));
    }

    int solveOne(const Job& job, const wss::SolveOptions& options, wss::SolveResult& res) {
        wss::Palette palette;
        wss::State start;
        std::string why;
        if (!wss::buildState(job.input, palette, start, &why)) {
            res = wss::SolveResult{};
            res.outcome = wss::SolveOutcome::InvalidInput;
            res.message = why;
            res.pour = options.pour;
            wss::log::error("puzzle {}: invalid input: {}", job.index, why);
            return wss::exitCodeFor(res, false);
        }
        for (const auto& w : wss::colorWarnings(start, palette))
            wss::log::warn("puzzle {}: {}", job.index, w);
        if (wss::log::enabled(wss::log::Level::Debug))
            wss::log::debug("puzzle {} initial state:\n{}", job.index, wss::describe(start, palette));

        wss::Solver solver(options);
        res = solver.solve(start);
        bool verified = false;
        switch (res.outcome) {
        case wss::SolveOutcome::Solved: {
            std::string err;
            verified = wss::verifySolution(start, res.moves, res.pour, &err);
            if (!verified) {
                // a solver defect, not a puzzle property
                wss::log::error("puzzle {}: solution failed verification: {}", job.index, err);
                break;
            }
            if (wss::log::enabled(wss::log::Level::Debug)) traceSolution(job.index, start, palette, res);
            wss::log::info("puzzle {}: solved in {} moves ({} states, {:.1f} ms)", job.index, res.moves.size(),
                res.statesVisited, res.elapsedMs);
            std::cout << job.index << ": " << wss::CsvIO::encodeMoves(res.moves) << "\n";
            break;
        }
        case wss::SolveOutcome::Unsolvable:
            wss::log::warn("puzzle {}: unsolvable after {} states; check the captured state", job.index, res.statesVisited);
            break;
        case wss::SolveOutcome::BudgetExhausted:
            wss::log::warn("puzzle {}: search budget exhausted ({}); retry with a larger budget", job.index, res.message);
            break;
        case wss::SolveOutcome::InvalidInput:
            wss::log::error("puzzle {}: invalid input: {}", job.index, res.message);
            break;
        }
        return wss::exitCodeFor(res, verified);
    }

    int run(const cxxopts::Options& options, const cxxopts::ParseResult& args) {
        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            return wss::kExitSolved;
        }
        if (args.count("verbose")) wss::log::setLevel(wss::log::Level::Debug);
        if (args.count("quiet")) wss::log::setLevel(wss::log::Level::Error);

        wss::SolveOptions solveOpt;
        const std::string mode = args["mode"].as<std::string>();
        if (mode == "bfs") solveOpt.mode = wss::SearchMode::BreadthFirst;
        else if (mode == "astar") solveOpt.mode = wss::SearchMode::BestFirst;
        else {
            std::cerr << "Unknown mode '" << mode << "'\n" << options.help() << std::endl;
            return wss::kExitUsage;
        }
        const std::string pour = args["pour"].as<std::string>();
        if (pour == "all") solveOpt.pour = wss::PourPolicy::AllOrNothing;
        else if (pour == "partial") solveOpt.pour = wss::PourPolicy::Partial;
        else {
            std::cerr << "Unknown pour policy '" << pour << "'\n" << options.help() << std::endl;
            return wss::kExitUsage;
        }
        solveOpt.maxStates = args["max-states"].as<int64_t>();
        solveOpt.timeBudgetMs = args["time-ms"].as<int>();
        std::string limitError;
        if (!wss::checkLimits(solveOpt.maxStates, solveOpt.timeBudgetMs, &limitError)) {
            std::cerr << limitError << "\n" << options.help() << std::endl;
            return wss::kExitUsage;
        }
        solveOpt.onProgress = [](const wss::SearchProgress& pr) {
            wss::log::debug("progress: {} iterations, {} in frontier, {} states, {:.0f} ms",
                pr.iterations, pr.frontier, pr.distinctStates, pr.elapsedMs);
        };

        std::vector<Job> jobs;
        if (args.count("generate")) {
            wss::Params p;
            p.numTubes = args["tubes"].as<int>();
            p.capacity = args["capacity"].as<int>();
            wss::GenOptions gen;
            gen.numColors = args["colors"].as<int>();
            gen.reservedEmpty = args["empty"].as<int>();
            gen.seed = args["seed"].as<uint64_t>();
            gen.validate = false;
            wss::Generator generator(p, gen);
            std::string why;
            if (!generator.checkParams(&why)) {
                wss::log::error("cannot generate: {}", why);
                return wss::kExitUsage;
            }
            const wss::Palette palette = wss::Palette::numbered(gen.numColors);
            for (int i = 0; i < args["generate"].as<int>(); ++i)
                jobs.push_back(Job{ i, wss::toInput(generator.createRandomMixed(), palette) });
        }
        else if (args.count("input")) {
            const std::string path = args["input"].as<std::string>();
            std::vector<wss::CsvRow> rows;
            std::vector<std::string> skipped;
            std::string err;
            if (!wss::CsvIO::load(path, rows, &skipped, &err)) {
                wss::log::error("{}", err);
                return wss::kExitUsage;
            }
            for (const auto& s : skipped) wss::log::warn("{}: skipped {}", path, s);
            for (const auto& r : rows) {
                Job job{ r.index, {} };
                if (!wss::CsvIO::decode(r, job.input, &err)) {
                    wss::log::warn("{}: puzzle {} skipped: {}", path, r.index, err);
                    continue;
                }
                jobs.push_back(std::move(job));
            }
            wss::log::info("loaded {} puzzles from {}", jobs.size(), path);
        }
        else {
            std::cerr << "Missing --input or --generate" << std::endl;
            std::cerr << options.help() << std::endl;
            return wss::kExitUsage;
        }

        int worst = wss::kExitSolved;
        std::vector<wss::CsvRow> out;
        for (const auto& job : jobs) {
            wss::SolveResult res;
            worst = wss::worseExit(worst, solveOne(job, solveOpt, res));
            out.push_back(wss::CsvIO::encode(job.index, job.input, &res));
        }

        if (args.count("output")) {
            std::string err;
            if (!wss::CsvIO::save(args["output"].as<std::string>(), out, false, &err)) {
                wss::log::error("{}", err);
                return wss::kExitUsage;
            }
        }
        return worst;
    }

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("wss_solve", "Water-sort puzzle solver");
    options.add_options()
        ("i,input", "Puzzle CSV file", cxxopts::value<std::string>())
        ("o,output", "Write puzzles with outcome and solution to this CSV", cxxopts::value<std::string>())
        ("m,mode", "Search mode: bfs or astar", cxxopts::value<std::string>()->default_value("bfs"))
        ("p,pour", "Pour semantics: all or partial", cxxopts::value<std::string>()->default_value("all"))
        ("max-states", "Distinct state limit, 0 = unlimited", cxxopts::value<int64_t>()->default_value("1000000"))
        ("time-ms", "Wall-clock limit per puzzle in ms, 0 = unlimited", cxxopts::value<int>()->default_value("0"))
        ("g,generate", "Deal N random puzzles instead of reading --input", cxxopts::value<int>())
        ("colors", "Colors per generated puzzle", cxxopts::value<int>()->default_value("5"))
        ("tubes", "Tubes per generated puzzle", cxxopts::value<int>()->default_value("7"))
        ("capacity", "Tube capacity", cxxopts::value<int>()->default_value("4"))
        ("empty", "Empty tubes per generated puzzle", cxxopts::value<int>()->default_value("2"))
        ("seed", "Generator seed", cxxopts::value<uint64_t>()->default_value("12345"))
        ("v,verbose", "Debug logging")
        ("q,quiet", "Errors only")
        ("h,help", "Print usage");

    try {
        auto args = options.parse(argc, argv);
        return run(options, args);
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return wss::kExitUsage;
    }
}
