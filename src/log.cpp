#include "memobuild/log.hpp"

#include <atomic>

namespace memobuild::log {

namespace {
std::atomic<Level> current_level{Level::Normal};
} // namespace

void set_level(Level level) {
    current_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return current_level.load(std::memory_order_relaxed);
}

} // namespace memobuild::log
