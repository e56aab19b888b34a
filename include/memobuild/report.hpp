#pragma once

#include "memobuild/graph.hpp"
#include "memobuild/session.hpp"
#include "memobuild/utility.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

namespace memobuild {

enum class BuildState { Init, GraphBuilt, DirtyMarked, Executing, Done, Failed };

std::string_view to_string(BuildState state);

enum class NodeStatus {
    Pending,
    Sourced,  ///< Source content read and stored.
    Cached,   ///< Resolved from a cache tier or a concurrent identical execution.
    Executed, ///< The Runner produced it in this build.
    WouldRun, ///< Dry run only.
    Failed,
    Skipped,  ///< An input failed, or fail-fast stopped the build.
    Cancelled,
};

std::string_view to_string(NodeStatus status);

struct NodeOutcome {
    NodeStatus status = NodeStatus::Pending;
    bool dirty = false;
    std::optional<Digest> output;
    std::optional<Error> error;
    bool integrity_violation = false;
    std::chrono::milliseconds duration{0};
};

/** @brief Result of one Executor::execute call. */
struct BuildReport {
    BuildState state = BuildState::Init;
    bool dry_run = false;
    bool cancelled = false;
    size_t levels = 0;
    std::vector<NodeOutcome> nodes;
    SessionStats stats;
    std::chrono::milliseconds elapsed{0};

    bool success() const {
        return state == BuildState::Done;
    }

    size_t count(NodeStatus status) const;
    bool integrity_violation() const;

    nlohmann::json to_json(const BuildGraph &graph) const;

    /** @brief Human readable summary: failures first, then totals. */
    void print(const BuildGraph &graph) const;
};

} // namespace memobuild
