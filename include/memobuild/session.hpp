#pragma once

#include <atomic>
#include <cstddef>
#include <stop_token>

namespace memobuild {

/** @brief Plain snapshot of the session counters. */
struct SessionStats {
    size_t l1_hits = 0;
    size_t l2_hits = 0;
    size_t l3_hits = 0;
    size_t misses = 0;
    size_t runner_invocations = 0;
    size_t remote_errors = 0;
    size_t integrity_failures = 0;
    size_t uploads = 0;
    size_t upload_failures = 0;
};

/**
 * @brief State owned by one build invocation: counters and the cancellation source.
 *
 * Passed explicitly through the executor and cache calls and discarded when the build ends.
 * Must outlive TieredCache::flush() for the builds that used it.
 */
class BuildSession {
public:
    struct Counters {
        std::atomic<size_t> l1_hits{0};
        std::atomic<size_t> l2_hits{0};
        std::atomic<size_t> l3_hits{0};
        std::atomic<size_t> misses{0};
        std::atomic<size_t> runner_invocations{0};
        std::atomic<size_t> remote_errors{0};
        std::atomic<size_t> integrity_failures{0};
        std::atomic<size_t> uploads{0};
        std::atomic<size_t> upload_failures{0};
    };

    BuildSession() = default;
    BuildSession(const BuildSession &) = delete;
    BuildSession &operator=(const BuildSession &) = delete;

    Counters &counters() {
        return counters_;
    }

    SessionStats stats() const;

    /** @brief Requests cancellation; in-flight work notices at its next check. */
    void cancel() {
        stop_.request_stop();
    }

    bool cancelled() const {
        return stop_.stop_requested();
    }

    std::stop_token stop_token() const {
        return stop_.get_token();
    }

private:
    Counters counters_;
    std::stop_source stop_;
};

} // namespace memobuild
