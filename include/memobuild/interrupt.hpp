#pragma once

#include "memobuild/session.hpp"

#include <csignal>
#include <thread>

namespace memobuild {

/**
 * @brief Turns SIGINT and SIGTERM into a cancellation of a BuildSession.
 *
 * Blocks both signals in the calling thread and waits for them on a dedicated thread, so it
 * must be created before any other thread is started. The first signal cancels the session;
 * a second one exits immediately with status 130.
 */
class InterruptWatch {
public:
    explicit InterruptWatch(BuildSession &session);
    ~InterruptWatch();

    InterruptWatch(const InterruptWatch &) = delete;
    InterruptWatch &operator=(const InterruptWatch &) = delete;

private:
    sigset_t previous_;
    std::jthread watcher_;
};

} // namespace memobuild
