// ========================= src/core/Generator.cpp =========================
#include "Generator.hpp"
#include <algorithm>

namespace wss {

    Generator::Generator(Params p_, GenOptions opt_) :p(p_), opt(std::move(opt_)) { rng.s = opt.seed ? opt.seed : 0xBADC0FFEEULL; }

    bool Generator::checkParams(std::string* why) const {
        auto bad = [why](const std::string& m) { if (why) *why = m; return false; };
        if (p.numTubes < 2) return bad("need at least 2 tubes");
        if (p.capacity < 1) return bad("capacity must be at least 1");
        if (opt.numColors < 1 || opt.numColors > kMaxColors) return bad("color count out of range");
        int fillable = p.numTubes - std::max(0, opt.reservedEmpty);
        if (fillable < 1) return bad("no tubes left to fill");
        if (opt.numColors > fillable)
            return bad(std::to_string(opt.numColors) + " colors do not fit into " + std::to_string(fillable) + " tubes");
        return true;
    }

    std::optional<Generated> Generator::makeOne() {
        if (!checkParams()) return std::nullopt;
        for (int tries = 0; tries < std::max(1, opt.attempts); ++tries) {
            Generated g;
            g.state = createRandomMixed();
            g.attempt = tries + 1;
            if (!opt.validate) return g;

            Solver solver(opt.solve);
            g.result = solver.solve(g.state);
            if (g.result.solved()) return g;
            // otherwise deal again
        }
        return std::nullopt;
    }

    State Generator::createRandomMixed() {
        State st; st.p = p; st.T.resize(p.numTubes);

        int fillable = std::max(1, p.numTubes - std::max(0, opt.reservedEmpty));
        fillable = std::min(fillable, p.numTubes);

        // color bag: capacity units of each color
        std::vector<Color> bag; bag.reserve(opt.numColors * p.capacity);
        for (int c = 1; c <= opt.numColors; ++c)
            for (int k = 0; k < p.capacity; ++k) bag.push_back((Color)c);

        for (size_t i = 0; i < bag.size(); ++i) {
            size_t j = size_t(rng.irange(0, (int)bag.size() - 1));
            std::swap(bag[i], bag[j]);
        }

        auto runlen = [](const Tube& t, Color c) {
            int len = 0; for (int i = t.size() - 1; i >= 0; --i) { if (t.units[i] == c) ++len; else break; }
            return len;
        };

        // deal into random tubes, capping same-color runs so the result stays mixed
        for (Color c : bag) {
            bool placed = false;
            for (int tries = 0; tries < 64 && !placed; ++tries) {
                int ti = rng.irange(0, fillable - 1);
                auto& t = st.T[ti];
                if (!t.isFull(p.capacity)) {
                    if (opt.maxRunPerTube <= 0 || runlen(t, c) < opt.maxRunPerTube) {
                        t.units.push_back(c);
                        placed = true;
                    }
                }
            }
            if (!placed) {
                // fallback: first tube with room
                for (int ti = 0; ti < fillable; ++ti) {
                    auto& t = st.T[ti];
                    if (!t.isFull(p.capacity)) { t.units.push_back(c); break; }
                }
            }
        }
        return st;
    }

} // namespace wss
