// ========================= src/util/Log.hpp =========================
#pragma once
#include <fmt/core.h>
#include <atomic>
#include <cstdio>
#include <string>
#include <utility>

namespace wss::log {

    enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

    inline std::atomic<int>& threshold() {
        static std::atomic<int> lvl{ static_cast<int>(Level::Info) };
        return lvl;
    }

    inline void setLevel(Level l) { threshold().store(static_cast<int>(l)); }
    inline bool enabled(Level l) { return static_cast<int>(l) >= threshold().load(); }

    inline const char* tag(Level l) {
        switch (l) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        default: return "";
        }
    }

    // one line to stderr: "[level] message"
    template <typename... Args>
    void write(Level l, fmt::format_string<Args...> f, Args&&... args) {
        if (!enabled(l)) return;
        std::string msg = fmt::format(f, std::forward<Args>(args)...);
        fmt::print(stderr, "[{}] {}\n", tag(l), msg);
    }

    template <typename... Args> void debug(fmt::format_string<Args...> f, Args&&... a) { write(Level::Debug, f, std::forward<Args>(a)...); }
    template <typename... Args> void info(fmt::format_string<Args...> f, Args&&... a) { write(Level::Info, f, std::forward<Args>(a)...); }
    template <typename... Args> void warn(fmt::format_string<Args...> f, Args&&... a) { write(Level::Warn, f, std::forward<Args>(a)...); }
    template <typename... Args> void error(fmt::format_string<Args...> f, Args&&... a) { write(Level::Error, f, std::forward<Args>(a)...); }

} // namespace wss::log
