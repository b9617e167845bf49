// ========================= src/core/Palette.hpp =========================
#pragma once
#include "Types.hpp"
#include <unordered_map>

namespace wss {

    // Maps opaque color tokens ("red", "c7", ...) to Color ids in first-seen order.
    class Palette {
    public:
        // returns kNoColor when the token is empty or the palette is full
        Color intern(const std::string& token);
        Color find(const std::string& token) const;
        const std::string& name(Color c) const;

        int size() const { return static_cast<int>(names.size()); }
        void clear() { names.clear(); ids.clear(); }

        // "c1".."cN" tokens for generated puzzles
        static Palette numbered(int numColors);

    private:
        std::vector<std::string> names; // names[id - 1]
        std::unordered_map<std::string, Color> ids;
    };

} // namespace wss
