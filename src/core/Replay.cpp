// ========================= src/core/Replay.cpp =========================
#include "Replay.hpp"

namespace wss {

    ReplayResult replay(const State& initial, const std::vector<Move>& moves, PourPolicy policy) {
        ReplayResult r;
        r.states.reserve(moves.size() + 1);
        r.states.push_back(initial);
        const int n = (int)initial.T.size();

        for (size_t i = 0; i < moves.size(); ++i) {
            const Move& m = moves[i];
            const State& cur = r.states.back();
            std::string where = "move " + std::to_string(i + 1) + " (" + std::to_string(m.from) + "->" + std::to_string(m.to) + ")";
            if (m.from < 0 || m.to < 0 || m.from >= n || m.to >= n) {
                r.failedStep = (int)i; r.error = where + ": tube index out of range"; return r;
            }
            if (m.from == m.to) {
                r.failedStep = (int)i; r.error = where + ": source and destination are the same tube"; return r;
            }
            int amount = 0;
            if (!cur.canPour(m.from, m.to, policy, &amount)) {
                r.failedStep = (int)i; r.error = where + ": illegal pour"; return r;
            }
            State next = cur;
            Move done{ m.from, m.to, amount };
            next.apply(done);
            r.applied.push_back(done);
            r.states.push_back(std::move(next));
        }
        r.ok = true;
        return r;
    }

    bool verifySolution(const State& initial, const std::vector<Move>& moves, PourPolicy policy, std::string* error) {
        auto setErr = [error](const std::string& msg) { if (error) *error = msg; return false; };

        ReplayResult r = replay(initial, moves, policy);
        if (!r.ok) return setErr(r.error);

        const auto counts = initial.colorCounts();
        for (size_t i = 0; i < r.states.size(); ++i) {
            const State& s = r.states[i];
            for (size_t t = 0; t < s.T.size(); ++t) {
                if (s.T[t].size() > s.p.capacity)
                    return setErr("step " + std::to_string(i) + ": tube " + std::to_string(t) + " over capacity");
            }
            if (s.colorCounts() != counts)
                return setErr("step " + std::to_string(i) + ": color totals changed");
        }
        if (!r.last().isSolved()) return setErr("final state is not solved");
        return true;
    }

} // namespace wss
