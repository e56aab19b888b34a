#pragma once

#include <cstdio>
#include <format>
#include <print>
#include <utility>

namespace memobuild::log {

enum class Level : int { Quiet = 0, Normal = 1, Verbose = 2 };

void set_level(Level level);
Level level();

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args &&...args) {
    if (level() >= Level::Verbose)
        std::println(stderr, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args &&...args) {
    if (level() >= Level::Normal)
        std::println(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args &&...args) {
    if (level() >= Level::Normal)
        std::println(stderr, "warning: {}", std::format(fmt, std::forward<Args>(args)...));
}

// Errors are never suppressed, even with -q.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args &&...args) {
    std::println(stderr, fmt, std::forward<Args>(args)...);
}

} // namespace memobuild::log
