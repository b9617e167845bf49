// ========================= src/core/Puzzle.cpp =========================
#include "Puzzle.hpp"
#include <sstream>

namespace wss {

    static bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        return false;
    }

    bool buildState(const PuzzleInput& in, Palette& palette, State& outState, std::string* error) {
        if (in.totalTubes < 2)
            return fail(error, "total tubes must be at least 2 (got " + std::to_string(in.totalTubes) + ")");
        if (in.capacity < 1)
            return fail(error, "capacity must be at least 1 (got " + std::to_string(in.capacity) + ")");
        if ((int)in.tubes.size() != in.totalTubes)
            return fail(error, "declared " + std::to_string(in.totalTubes) + " tubes but " +
                std::to_string(in.tubes.size()) + " were supplied");

        // intern into a scratch copy so a rejected puzzle leaves the palette alone
        Palette pal = palette;
        State st;
        st.p.numTubes = in.totalTubes;
        st.p.capacity = in.capacity;
        st.T.resize(in.totalTubes);
        int empties = 0;
        for (int i = 0; i < in.totalTubes; ++i) {
            const auto& tokens = in.tubes[i];
            if ((int)tokens.size() > in.capacity)
                return fail(error, "tube " + std::to_string(i) + " holds " + std::to_string(tokens.size()) +
                    " units, capacity is " + std::to_string(in.capacity));
            if (tokens.empty()) ++empties;
            for (const auto& tok : tokens) {
                if (tok.empty()) return fail(error, "tube " + std::to_string(i) + " contains an empty color token");
                Color c = pal.intern(tok);
                if (c == kNoColor) return fail(error, "too many distinct colors (limit " + std::to_string(kMaxColors) + ")");
                st.T[i].units.push_back(c);
            }
        }
        if (in.emptyTubes >= 0 && in.emptyTubes != empties)
            return fail(error, "declared " + std::to_string(in.emptyTubes) + " empty tubes but found " + std::to_string(empties));

        palette = std::move(pal);
        outState = std::move(st);
        return true;
    }

    PuzzleInput toInput(const State& s, const Palette& palette) {
        PuzzleInput in;
        in.totalTubes = (int)s.T.size();
        in.capacity = s.p.capacity;
        in.emptyTubes = s.emptyCount();
        in.tubes.resize(s.T.size());
        for (size_t i = 0; i < s.T.size(); ++i)
            for (Color c : s.T[i].units) in.tubes[i].push_back(palette.name(c));
        return in;
    }

    std::string describe(const State& s, const Palette& palette) {
        std::ostringstream oss;
        for (size_t i = 0; i < s.T.size(); ++i) {
            oss << "Tube " << i << ":";
            if (s.T[i].isEmpty()) oss << " [empty]";
            for (Color c : s.T[i].units) oss << ' ' << palette.name(c);
            oss << '\n';
        }
        return oss.str();
    }

    std::string describeMove(const State& before, const Move& m, const Palette& palette) {
        Color c = kNoColor;
        if (m.from >= 0 && m.from < (int)before.T.size()) c = before.T[m.from].topColor();
        std::ostringstream oss;
        oss << "Pouring " << m.amount << " unit(s) of '" << palette.name(c) << "' from Tube " << m.from << " to Tube " << m.to;
        return oss.str();
    }

    std::vector<std::string> colorWarnings(const State& s, const Palette& palette) {
        std::vector<std::string> out;
        for (const auto& [c, n] : s.colorCounts()) {
            if (n != s.p.capacity)
                out.push_back("color '" + palette.name(c) + "' has " + std::to_string(n) +
                    " units, expected " + std::to_string(s.p.capacity));
        }
        return out;
    }

} // namespace wss
