#pragma once

#include "memobuild/graph.hpp"
#include "memobuild/report.hpp"
#include "memobuild/runner.hpp"
#include "memobuild/session.hpp"
#include "memobuild/session_record.hpp"
#include "memobuild/tiered_cache.hpp"
#include "memobuild/utility.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace memobuild {

enum class FailureMode {
    FailFast, ///< The first failed level stops the build.
    Isolated, ///< Independent subgraphs continue; dependents of failures are skipped.
};

struct ExecutorConfig {
    size_t jobs = 0; // 0 means auto-detect
    FailureMode failure_mode = FailureMode::FailFast;
    bool dry_run = false;
};

/**
 * @brief Walks the graph level by level, resolving each node from the cache or the Runner.
 *
 * Init -> GraphBuilt -> DirtyMarked -> Executing -> Done | Failed. Nodes of one level run
 * concurrently on a worker pool; level k+1 starts only after level k is resolved. Executions
 * are collapsed per node digest through the cache's single-flight registry, and their output is
 * committed only after it passed the integrity check and no cancellation was requested.
 */
class Executor {
public:
    Executor(BuildGraph graph, TieredCache &cache, Runner runner, Environment env = {}, ExecutorConfig config = {});

    /**
     * @brief Runs one build.
     *
     * Node failures are reported in the returned BuildReport (state Failed). The Result itself
     * only fails for problems that prevent execution from starting, e.g. a digest that cannot be
     * computed or an execute() already in progress. `record` receives the digests of every node
     * that was resolved.
     */
    Result<BuildReport> execute(BuildSession &session, SessionRecord &record);

    BuildState state() const {
        return state_.load();
    }

    const BuildGraph &graph() const {
        return graph_;
    }

    /** @brief Artifact produced or fetched for `id` by the last execute(); null if none. */
    const Artifact *artifact(NodeId id) const;

    /** @brief Every available artifact of the last execute(), by node id. */
    std::vector<std::pair<NodeId, const Artifact *>> artifacts() const;

private:
    NodeOutcome resolve_node(NodeId id, BuildSession &session);
    Result<Artifact> resolve_source(const Node &node, BuildSession &session);
    Result<std::optional<Artifact>> lookup_cached(const Digest &digest, BuildSession &session);
    Result<Artifact> run_node(const Node &node, BuildSession &session, bool &ran);
    void report_progress(const Node &node, const NodeOutcome &outcome);

    BuildGraph graph_;
    TieredCache &cache_;
    Runner runner_;
    Environment env_;
    ExecutorConfig config_;

    std::atomic<BuildState> state_{BuildState::Init};
    std::vector<std::optional<Artifact>> artifacts_;
    std::mutex progress_mtx_;
    size_t progress_done_ = 0;
    size_t progress_total_ = 0;
};

} // namespace memobuild
