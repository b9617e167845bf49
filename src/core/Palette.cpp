// ========================= src/core/Palette.cpp =========================
#include "Palette.hpp"

namespace wss {

    Color Palette::intern(const std::string& token) {
        if (token.empty()) return kNoColor;
        auto it = ids.find(token);
        if (it != ids.end()) return it->second;
        if (size() >= kMaxColors) return kNoColor;
        names.push_back(token);
        Color id = (Color)names.size();
        ids.emplace(token, id);
        return id;
    }

    Color Palette::find(const std::string& token) const {
        auto it = ids.find(token);
        return it == ids.end() ? kNoColor : it->second;
    }

    const std::string& Palette::name(Color c) const {
        static const std::string unknown = "?";
        if (c == kNoColor || c > names.size()) return unknown;
        return names[c - 1];
    }

    Palette Palette::numbered(int numColors) {
        Palette pal;
        for (int c = 1; c <= numColors && c <= kMaxColors; ++c) pal.intern("c" + std::to_string(c));
        return pal;
    }

} // namespace wss
