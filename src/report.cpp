#include "memobuild/report.hpp"

#include "memobuild/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace memobuild {

std::string_view to_string(BuildState state) {
    switch (state) {
    case BuildState::Init:
        return "init";
    case BuildState::GraphBuilt:
        return "graph-built";
    case BuildState::DirtyMarked:
        return "dirty-marked";
    case BuildState::Executing:
        return "executing";
    case BuildState::Done:
        return "done";
    case BuildState::Failed:
        return "failed";
    }
    return "init";
}

std::string_view to_string(NodeStatus status) {
    switch (status) {
    case NodeStatus::Pending:
        return "pending";
    case NodeStatus::Sourced:
        return "sourced";
    case NodeStatus::Cached:
        return "cached";
    case NodeStatus::Executed:
        return "executed";
    case NodeStatus::WouldRun:
        return "would-run";
    case NodeStatus::Failed:
        return "failed";
    case NodeStatus::Skipped:
        return "skipped";
    case NodeStatus::Cancelled:
        return "cancelled";
    }
    return "pending";
}

size_t BuildReport::count(NodeStatus status) const {
    return static_cast<size_t>(
        std::count_if(nodes.begin(), nodes.end(), [&](const NodeOutcome &n) { return n.status == status; }));
}

bool BuildReport::integrity_violation() const {
    return std::any_of(nodes.begin(), nodes.end(), [](const NodeOutcome &n) { return n.integrity_violation; });
}

nlohmann::json BuildReport::to_json(const BuildGraph &graph) const {
    using json = nlohmann::json;
    json out;
    out["state"] = to_string(state);
    out["dry_run"] = dry_run;
    out["cancelled"] = cancelled;
    out["levels"] = levels;
    out["elapsed_ms"] = elapsed.count();
    out["integrity_violation"] = integrity_violation();
    out["cache"] = {{"l1_hits", stats.l1_hits},
                    {"l2_hits", stats.l2_hits},
                    {"l3_hits", stats.l3_hits},
                    {"misses", stats.misses},
                    {"remote_errors", stats.remote_errors},
                    {"integrity_failures", stats.integrity_failures},
                    {"uploads", stats.uploads},
                    {"upload_failures", stats.upload_failures}};
    out["runner_invocations"] = stats.runner_invocations;

    json list = json::array();
    for (NodeId id = 0; id < nodes.size(); ++id) {
        const Node &node = graph.node(id);
        const NodeOutcome &outcome = nodes[id];
        json entry;
        entry["id"] = id;
        entry["name"] = node.name;
        entry["kind"] = to_string(node.kind);
        entry["status"] = to_string(outcome.status);
        entry["dirty"] = outcome.dirty;
        entry["duration_ms"] = outcome.duration.count();
        if (node.digest)
            entry["digest"] = node.digest->hex();
        if (outcome.output)
            entry["output"] = outcome.output->hex();
        if (outcome.error) {
            entry["error"] = {{"kind", to_string(outcome.error->kind)}, {"message", outcome.error->message}};
            entry["integrity_violation"] = outcome.integrity_violation;
        }
        list.push_back(std::move(entry));
    }
    out["nodes"] = std::move(list);
    return out;
}

void BuildReport::print(const BuildGraph &graph) const {
    for (NodeId id = 0; id < nodes.size(); ++id) {
        const NodeOutcome &outcome = nodes[id];
        if (outcome.status != NodeStatus::Failed || !outcome.error)
            continue;
        const Node &node = graph.node(id);
        std::string_view label = node.name.empty() ? std::string_view(node.instruction) : std::string_view(node.name);
        if (outcome.integrity_violation)
            log::error("INTEGRITY VIOLATION {}: {}", label, outcome.error->message);
        else
            log::error("FAILED {}: {}", label, *outcome.error);
    }

    if (dry_run) {
        log::info("Dry run: {} would run, {} cached, {} nodes in {} levels", count(NodeStatus::WouldRun),
                  count(NodeStatus::Cached), nodes.size(), levels);
        return;
    }

    log::info("{} in {}ms: {} executed, {} cached, {} failed, {} skipped{}", success() ? "Build finished" : "Build failed",
              elapsed.count(), count(NodeStatus::Executed), count(NodeStatus::Cached), count(NodeStatus::Failed),
              count(NodeStatus::Skipped), cancelled ? " (cancelled)" : "");
    log::debug("cache: l1 {} / l2 {} / l3 {} hits, {} misses, {} remote errors, {} uploads", stats.l1_hits,
               stats.l2_hits, stats.l3_hits, stats.misses, stats.remote_errors, stats.uploads);
}

} // namespace memobuild
