// ========================= src/core/State.cpp =========================
#include "State.hpp"
#include <algorithm>

namespace wss {

    static uint64_t rotl(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }
    uint64_t RNG::next() { s ^= rotl(s, 7); s ^= (s >> 9); return s * 0x9E3779B97F4A7C15ULL; }
    int RNG::irange(int lo, int hi) { return lo + int(next() % uint64_t(hi - lo + 1)); }

    State State::fromTubes(int capacity, const std::vector<std::vector<Color>>& tubes) {
        State st;
        st.p.numTubes = static_cast<int>(tubes.size());
        st.p.capacity = capacity;
        st.T.resize(tubes.size());
        for (size_t i = 0; i < tubes.size(); ++i) st.T[i].units = tubes[i];
        return st;
    }

    bool State::canPour(int from, int to, PourPolicy policy, int* outAmount) const {
        if (from == to || from < 0 || to < 0 || from >= (int)T.size() || to >= (int)T.size()) return false;
        const auto& tf = T[from];
        const auto& tt = T[to];

        int chunk = tf.blockSize();
        if (chunk == 0) return false;
        if (tt.isFull(p.capacity)) return false;

        Color destTop = tt.topColor();
        if (destTop != kNoColor && destTop != tf.topColor()) return false;

        int free = p.capacity - tt.size();
        if (policy == PourPolicy::AllOrNothing && chunk > free) return false;

        int mv = std::min(chunk, free);
        if (mv <= 0) return false;
        if (outAmount) *outAmount = mv;
        return true;
    }

    bool State::isUseful(int from, int to) const {
        if (!T[to].isEmpty()) return true;
        return !T[from].isSettled();
    }

    void State::apply(const Move& m) {
        if (m.from < 0 || m.to < 0 || m.from >= (int)T.size() || m.to >= (int)T.size()) return;
        auto& f = T[m.from];
        auto& t = T[m.to];
        int amount = m.amount;
        if (amount > f.size()) amount = f.size();
        for (int i = 0; i < amount; ++i) {
            t.units.push_back(f.units.back());
            f.units.pop_back();
        }
    }

    std::vector<Move> State::legalMoves(PourPolicy policy) const {
        std::vector<Move> out;
        const int n = (int)T.size();
        for (int i = 0; i < n; ++i) {
            if (T[i].blockSize() == 0) continue;
            for (int j = 0; j < n; ++j) {
                if (i == j) continue;
                int amt = 0;
                if (!canPour(i, j, policy, &amt)) continue;
                if (!isUseful(i, j)) continue;
                out.push_back(Move{ i, j, amt });
            }
        }
        return out;
    }

    bool State::isSolved() const {
        for (const auto& t : T) { if (!t.isSettled()) return false; }
        return true;
    }

    int State::emptyCount() const {
        return (int)std::count_if(T.begin(), T.end(), [](const Tube& t) { return t.isEmpty(); });
    }

    std::map<Color, int> State::colorCounts() const {
        std::map<Color, int> counts;
        for (const auto& t : T)
            for (Color c : t.units) ++counts[c];
        return counts;
    }

    std::string State::key() const {
        std::string k;
        k.reserve(T.size() * (p.capacity * 4 + 1));
        for (size_t i = 0; i < T.size(); ++i) {
            if (i > 0) k.push_back('|');
            const auto& u = T[i].units;
            for (size_t j = 0; j < u.size(); ++j) {
                if (j > 0) k.push_back(',');
                k += std::to_string(int(u[j]));
            }
        }
        return k;
    }

    size_t State::hash() const {
        uint64_t h = 1469598103934665603ull;
        for (const auto& t : T) {
            for (Color c : t.units) {
                h ^= uint64_t(c) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
            }
            // tube boundary so [a][b] and [a,b][] differ
            h ^= 0xff + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        }
        return size_t(h);
    }

} // namespace wss
