#include "memobuild/interrupt.hpp"

#include "memobuild/log.hpp"

#include <pthread.h>

#include <cstdlib>
#include <ctime>

namespace memobuild {

namespace {

sigset_t interrupt_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

InterruptWatch::InterruptWatch(BuildSession &session) {
    sigset_t set = interrupt_signals();
    pthread_sigmask(SIG_BLOCK, &set, &previous_);

    watcher_ = std::jthread([&session, set](std::stop_token stop) {
        const timespec tick{0, 200'000'000};
        while (!stop.stop_requested()) {
            int sig = sigtimedwait(&set, nullptr, &tick);
            if (sig < 0)
                continue;
            if (session.cancelled()) {
                log::error("interrupted again, exiting");
                std::_Exit(130);
            }
            log::warn("received signal {}, cancelling build (repeat to exit now)", sig);
            session.cancel();
        }
    });
}

InterruptWatch::~InterruptWatch() {
    watcher_.request_stop();
    watcher_.join();
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

} // namespace memobuild
