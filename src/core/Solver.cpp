// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include "Budget.hpp"
#include <algorithm>
#include <deque>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace wss {

    const char* toString(SolveOutcome o) {
        switch (o) {
        case SolveOutcome::Solved: return "solved";
        case SolveOutcome::Unsolvable: return "unsolvable";
        case SolveOutcome::BudgetExhausted: return "budget";
        case SolveOutcome::InvalidInput: return "invalid";
        }
        return "unknown";
    }

    namespace {

        // Search tree arena: each discovered state remembers how it was reached.
        struct Node { int parent{ -1 }; Move move{}; };

        std::vector<Move> tracePath(const std::vector<Node>& nodes, int idx) {
            std::vector<Move> out;
            for (int i = idx; i > 0; i = nodes[i].parent) out.push_back(nodes[i].move);
            std::reverse(out.begin(), out.end());
            return out;
        }

        bool checkStructure(const State& s, std::string* why) {
            if ((int)s.T.size() < 2) { *why = "total tubes must be at least 2"; return false; }
            if (s.p.capacity < 1) { *why = "capacity must be at least 1"; return false; }
            if (s.p.numTubes != (int)s.T.size()) {
                *why = "declared " + std::to_string(s.p.numTubes) + " tubes but state holds " + std::to_string(s.T.size());
                return false;
            }
            for (size_t i = 0; i < s.T.size(); ++i) {
                if (s.T[i].size() > s.p.capacity) {
                    *why = "tube " + std::to_string(i) + " exceeds capacity " + std::to_string(s.p.capacity);
                    return false;
                }
                for (Color c : s.T[i].units) {
                    if (c == kNoColor) { *why = "tube " + std::to_string(i) + " holds an uncolored unit"; return false; }
                }
            }
            return true;
        }

        // Returns true and fills res when a limit has been hit.
        bool budgetTripped(const SearchBudget& budget, const SolveOptions& opt, int64_t distinct, SolveResult& res) {
            if (budget.statesExhausted(distinct)) {
                res.outcome = SolveOutcome::BudgetExhausted;
                res.message = "state limit of " + std::to_string(opt.maxStates) + " reached";
                return true;
            }
            if (budget.timeExhausted()) {
                res.outcome = SolveOutcome::BudgetExhausted;
                res.message = "time limit of " + std::to_string(opt.timeBudgetMs) + " ms reached";
                return true;
            }
            return false;
        }

        void reportProgress(const SolveOptions& opt, const SearchBudget& budget, int64_t iterations,
            int64_t frontier, int64_t distinct) {
            if (!opt.onProgress || opt.progressInterval <= 0) return;
            if (iterations % opt.progressInterval != 0) return;
            SearchProgress pr;
            pr.iterations = iterations;
            pr.frontier = frontier;
            pr.distinctStates = distinct;
            pr.elapsedMs = budget.elapsedMs();
            opt.onProgress(pr);
        }

    } // namespace

    int heuristic(const State& s) {
        int h = 0;
        // broken color runs inside each tube
        for (const auto& t : s.T) {
            for (int i = 1; i < t.size(); ++i)
                if (t.units[i] != t.units[i - 1]) ++h;
        }
        // colors sitting at the bottom of more than one tube
        std::unordered_map<Color, int> bottoms;
        for (const auto& t : s.T)
            if (!t.isEmpty()) ++bottoms[t.bottomColor()];
        for (const auto& kv : bottoms)
            if (kv.second > 1) h += kv.second - 1;
        return h;
    }

    SolveResult Solver::solve(const PuzzleInput& input, Palette& palette) const {
        State start;
        std::string why;
        if (!buildState(input, palette, start, &why)) {
            SolveResult res;
            res.outcome = SolveOutcome::InvalidInput;
            res.message = why;
            res.pour = opt.pour;
            return res;
        }
        return solve(start);
    }

    SolveResult Solver::solve(const State& start) const {
        std::string why;
        if (!checkStructure(start, &why)) {
            SolveResult res;
            res.outcome = SolveOutcome::InvalidInput;
            res.message = why;
            res.pour = opt.pour;
            return res;
        }
        return opt.mode == SearchMode::BestFirst ? bestFirst(start) : breadthFirst(start);
    }

    SolveResult Solver::breadthFirst(const State& start) const {
        SearchBudget budget(opt.maxStates, opt.timeBudgetMs);
        budget.start();
        SolveResult res;
        res.pour = opt.pour;

        std::vector<Node> nodes{ Node{} };
        std::deque<std::pair<State, int>> open;
        open.emplace_back(start, 0);
        // every state ever enqueued
        std::unordered_set<std::string> visited{ start.key() };

        while (!open.empty()) {
            std::pair<State, int> cur = std::move(open.front());
            open.pop_front();
            ++res.statesExpanded;
            reportProgress(opt, budget, res.statesExpanded, (int64_t)open.size(), (int64_t)visited.size());

            const State& s = cur.first;
            if (s.isSolved()) {
                res.outcome = SolveOutcome::Solved;
                res.moves = tracePath(nodes, cur.second);
                break;
            }
            if (budgetTripped(budget, opt, (int64_t)visited.size(), res)) break;

            for (const Move& m : s.legalMoves(opt.pour)) {
                State next = s;
                next.apply(m);
                if (!visited.insert(next.key()).second) continue;
                nodes.push_back(Node{ cur.second, m });
                open.emplace_back(std::move(next), (int)nodes.size() - 1);
            }
        }
        // loop ran dry without a verdict: proven unsolvable (the default outcome)

        res.statesVisited = (int64_t)visited.size();
        res.elapsedMs = budget.elapsedMs();
        return res;
    }

    SolveResult Solver::bestFirst(const State& start) const {
        SearchBudget budget(opt.maxStates, opt.timeBudgetMs);
        budget.start();
        SolveResult res;
        res.pour = opt.pour;

        struct Entry {
            int f{ 0 };
            uint64_t order{ 0 }; // insertion counter, earlier wins on equal f
            int g{ 0 };
            int node{ 0 };
            State s;
            std::string key;
        };
        struct Later {
            // true if a should be expanded after b
            bool operator()(const Entry& a, const Entry& b) const {
                if (a.f != b.f) return a.f > b.f;
                return a.order > b.order;
            }
        };

        std::vector<Node> nodes{ Node{} };
        std::priority_queue<Entry, std::vector<Entry>, Later> open;
        std::unordered_map<std::string, int> gScore;
        uint64_t counter = 0;

        {
            Entry e;
            e.f = heuristic(start);
            e.order = counter++;
            e.s = start;
            e.key = start.key();
            gScore.emplace(e.key, 0);
            open.push(std::move(e));
        }

        while (!open.empty()) {
            Entry cur = open.top();
            open.pop();
            ++res.statesExpanded;
            reportProgress(opt, budget, res.statesExpanded, (int64_t)open.size(), (int64_t)gScore.size());

            // a cheaper path to this state was queued after this entry
            auto best = gScore.find(cur.key);
            if (best != gScore.end() && cur.g > best->second) continue;

            if (cur.s.isSolved()) {
                res.outcome = SolveOutcome::Solved;
                res.moves = tracePath(nodes, cur.node);
                break;
            }
            if (budgetTripped(budget, opt, (int64_t)gScore.size(), res)) break;

            const int tentative = cur.g + 1;
            for (const Move& m : cur.s.legalMoves(opt.pour)) {
                Entry next;
                next.s = cur.s;
                next.s.apply(m);
                next.key = next.s.key();

                auto it = gScore.find(next.key);
                if (it != gScore.end() && it->second <= tentative) continue;
                gScore[next.key] = tentative;

                nodes.push_back(Node{ cur.node, m });
                next.g = tentative;
                next.f = tentative + heuristic(next.s);
                next.order = counter++;
                next.node = (int)nodes.size() - 1;
                open.push(std::move(next));
            }
        }

        res.statesVisited = (int64_t)gScore.size();
        res.elapsedMs = budget.elapsedMs();
        return res;
    }

} // namespace wss
