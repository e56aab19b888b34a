#include "memobuild/session.hpp"

namespace memobuild {

SessionStats BuildSession::stats() const {
    SessionStats s;
    s.l1_hits = counters_.l1_hits.load();
    s.l2_hits = counters_.l2_hits.load();
    s.l3_hits = counters_.l3_hits.load();
    s.misses = counters_.misses.load();
    s.runner_invocations = counters_.runner_invocations.load();
    s.remote_errors = counters_.remote_errors.load();
    s.integrity_failures = counters_.integrity_failures.load();
    s.uploads = counters_.uploads.load();
    s.upload_failures = counters_.upload_failures.load();
    return s;
}

} // namespace memobuild
