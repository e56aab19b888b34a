#include "memobuild/executor.hpp"

#include "memobuild/dirty.hpp"
#include "memobuild/fingerprint.hpp"
#include "memobuild/log.hpp"
#include "memobuild/mmap.hpp"
#include "memobuild/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <future>

#include <unistd.h>

namespace memobuild {

namespace {

bool is_plain_source(const Node &node) {
    return node.kind == NodeKind::Source && node.inputs.empty() && node.instruction.empty();
}

std::string_view label_of(const Node &node) {
    return node.name.empty() ? std::string_view(node.instruction) : std::string_view(node.name);
}

bool resolved(NodeStatus status) {
    return status == NodeStatus::Sourced || status == NodeStatus::Cached || status == NodeStatus::Executed;
}

NodeOutcome failed_outcome(Error err) {
    NodeOutcome outcome;
    outcome.status = err.is(ErrorKind::Cancelled) ? NodeStatus::Cancelled : NodeStatus::Failed;
    outcome.integrity_violation = err.is(ErrorKind::CASIntegrityFailure);
    outcome.error = std::move(err);
    return outcome;
}

} // namespace

Executor::Executor(BuildGraph graph, TieredCache &cache, Runner runner, Environment env, ExecutorConfig config)
    : graph_(std::move(graph)), cache_(cache), runner_(std::move(runner)), env_(std::move(env)), config_(config) {
}

const Artifact *Executor::artifact(NodeId id) const {
    if (id >= artifacts_.size() || !artifacts_[id])
        return nullptr;
    return &*artifacts_[id];
}

std::vector<std::pair<NodeId, const Artifact *>> Executor::artifacts() const {
    std::vector<std::pair<NodeId, const Artifact *>> out;
    for (NodeId id = 0; id < artifacts_.size(); ++id) {
        if (artifacts_[id])
            out.emplace_back(id, &*artifacts_[id]);
    }
    return out;
}

Result<BuildReport> Executor::execute(BuildSession &session, SessionRecord &record) {
    if (graph_.environment_fingerprint() != env_.fingerprint()) {
        return failf(ErrorKind::InvalidState, "Graph was digested for environment {} but runs in {}",
                     graph_.environment_fingerprint().short_hex(), env_.fingerprint().short_hex());
    }

    BuildState current = state_.load();
    if (current == BuildState::GraphBuilt || current == BuildState::DirtyMarked || current == BuildState::Executing ||
        !state_.compare_exchange_strong(current, BuildState::GraphBuilt)) {
        return failf(ErrorKind::InvalidState, "Cannot start a build while in state {}", to_string(current));
    }

    auto start = std::chrono::steady_clock::now();
    BuildReport report;
    report.dry_run = config_.dry_run;

    const auto &levels = graph_.topological_levels();
    report.levels = levels.size();

    auto marked = DirtyPropagator(record).mark(graph_);
    if (!marked) {
        state_ = BuildState::Failed;
        return std::unexpected(marked.error());
    }
    state_ = BuildState::DirtyMarked;
    log::debug("{} of {} nodes dirty ({} changed)", marked->dirty.size(), graph_.size(), marked->seeds.size());

    artifacts_.assign(graph_.size(), std::nullopt);
    report.nodes.assign(graph_.size(), NodeOutcome{});
    for (NodeId id = 0; id < graph_.size(); ++id)
        report.nodes[id].dirty = graph_.node(id).dirty;

    progress_done_ = 0;
    progress_total_ = marked->dirty.size();

    state_ = BuildState::Executing;
    bool stop_levels = false;
    // set by the first failure in fail-fast mode; queued tasks check it before starting
    std::atomic<bool> abort{false};
    {
        WorkerPool pool(config_.jobs);

        for (const auto &level : levels) {
            if (stop_levels || session.cancelled()) {
                for (NodeId id : level) {
                    report.nodes[id].status = session.cancelled() ? NodeStatus::Cancelled : NodeStatus::Skipped;
                }
                continue;
            }

            std::vector<std::pair<NodeId, std::future<NodeOutcome>>> pending;
            for (NodeId id : level) {
                const Node &node = graph_.node(id);
                auto bad_input = std::find_if(node.inputs.begin(), node.inputs.end(), [&](NodeId in) {
                    return !resolved(report.nodes[in].status) && report.nodes[in].status != NodeStatus::WouldRun;
                });
                if (bad_input != node.inputs.end()) {
                    report.nodes[id].status = NodeStatus::Skipped;
                    report.nodes[id].error = Error{ErrorKind::InvalidState,
                                                   std::format("input '{}' did not complete", label_of(graph_.node(*bad_input)))};
                    continue;
                }
                pending.emplace_back(id, pool.submit([this, id, &session, &abort] {
                    if (abort.load()) {
                        NodeOutcome skipped;
                        skipped.status = NodeStatus::Skipped;
                        skipped.error = Error{ErrorKind::InvalidState, "build stopped after an earlier failure"};
                        return skipped;
                    }
                    NodeOutcome outcome;
                    try {
                        outcome = resolve_node(id, session);
                    } catch (const std::exception &err) {
                        outcome = failed_outcome(Error{ErrorKind::RunnerError, err.what()});
                    }
                    if (outcome.status == NodeStatus::Failed && config_.failure_mode == FailureMode::FailFast)
                        abort = true;
                    return outcome;
                }));
            }

            bool level_failed = false;
            for (auto &[id, fut] : pending) {
                NodeOutcome outcome = fut.get();
                outcome.dirty = report.nodes[id].dirty;
                if (outcome.status == NodeStatus::Failed)
                    level_failed = true;
                report.nodes[id] = std::move(outcome);
            }

            if (level_failed && config_.failure_mode == FailureMode::FailFast)
                stop_levels = true;
        }
    }

    cache_.flush();

    std::vector<NodeId> done;
    for (NodeId id = 0; id < graph_.size(); ++id) {
        if (resolved(report.nodes[id].status))
            done.push_back(id);
    }
    if (!config_.dry_run)
        update_record(record, graph_, done);

    report.cancelled = session.cancelled();
    bool all_resolved = std::all_of(report.nodes.begin(), report.nodes.end(), [&](const NodeOutcome &n) {
        return resolved(n.status) || (config_.dry_run && n.status == NodeStatus::WouldRun);
    });
    report.state = all_resolved && !report.cancelled ? BuildState::Done : BuildState::Failed;
    report.stats = session.stats();
    report.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    state_ = report.state;
    return report;
}

NodeOutcome Executor::resolve_node(NodeId id, BuildSession &session) {
    const Node &node = graph_.node(id);
    const Digest &digest = *node.digest;
    auto start = std::chrono::steady_clock::now();
    NodeOutcome outcome;

    if (session.cancelled())
        return failed_outcome(Error{ErrorKind::Cancelled, "build cancelled"});

    if (is_plain_source(node)) {
        if (config_.dry_run) {
            outcome.status = NodeStatus::Sourced;
            return outcome;
        }
        auto artifact = resolve_source(node, session);
        if (!artifact)
            return failed_outcome(artifact.error());
        outcome.status = NodeStatus::Sourced;
        outcome.output = artifact->digest;
        artifacts_[id] = std::move(*artifact);
    } else if (config_.dry_run) {
        auto action = cache_.lookup_action(digest, session);
        if (!action)
            return failed_outcome(action.error());
        outcome.status = (!node.dirty && *action) ? NodeStatus::Cached : NodeStatus::WouldRun;
        if (*action)
            outcome.output = (*action)->output_digest;
        if (outcome.status == NodeStatus::WouldRun)
            report_progress(node, outcome);
        return outcome;
    } else {
        auto cached = lookup_cached(digest, session);
        if (!cached)
            return failed_outcome(cached.error());

        if (*cached) {
            outcome.status = NodeStatus::Cached;
            outcome.output = (*cached)->digest;
            artifacts_[id] = std::move(**cached);
        } else {
            bool ran = false;
            auto flight = cache_.flights().run(digest, [&] { return run_node(node, session, ran); });
            if (!flight.value)
                return failed_outcome(flight.value.error());
            outcome.status = ran ? NodeStatus::Executed : NodeStatus::Cached;
            outcome.output = flight.value->digest;
            artifacts_[id] = std::move(*flight.value);
        }
    }

    outcome.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    report_progress(node, outcome);
    return outcome;
}

Result<Artifact> Executor::resolve_source(const Node &node, BuildSession &session) {
    const Digest &digest = *node.digest;

    if (!node.content) {
        // the digest was taken when the graph was loaded; the filesystem is only read on a miss
        auto cached = cache_.get(digest, session);
        if (cached || !cached.error().is(ErrorKind::CacheMiss))
            return cached;
        if (node.source_path.empty())
            return failf(ErrorKind::InvalidState, "source '{}' has no content and is not cached", label_of(node));
    }

    std::string bytes;
    if (node.content) {
        bytes = *node.content;
    } else {
        std::error_code ec;
        if (std::filesystem::is_directory(node.source_path, ec)) {
            auto tree = fingerprint_tree(node.source_path, IgnoreRules::load_for(node.source_path));
            if (!tree)
                return std::unexpected(tree.error());
            bytes = serialize_manifest(tree->entries);
        } else {
            try {
                MappedFile file(node.source_path);
                bytes = std::string(file.content());
            } catch (const std::runtime_error &err) {
                return fail(ErrorKind::FilesystemError, err.what());
            }
        }
    }

    Artifact artifact = Artifact::from_bytes(std::move(bytes));
    if (artifact.digest != digest) {
        return failf(ErrorKind::FilesystemError, "source '{}' changed while the build was running", label_of(node));
    }
    if (auto ok = cache_.put(digest, artifact, session); !ok)
        return std::unexpected(ok.error());
    return artifact;
}

Result<std::optional<Artifact>> Executor::lookup_cached(const Digest &digest, BuildSession &session) {
    auto action = cache_.lookup_action(digest, session);
    if (!action)
        return std::unexpected(action.error());
    if (!*action)
        return std::nullopt;

    auto blob = cache_.get((*action)->output_digest, session);
    if (blob)
        return std::move(*blob);
    if (blob.error().is(ErrorKind::CacheMiss)) {
        log::debug("action {} points at a missing artifact, running again", digest.short_hex());
        return std::nullopt;
    }
    return std::unexpected(blob.error());
}

Result<Artifact> Executor::run_node(const Node &node, BuildSession &session, bool &ran) {
    const Digest &digest = *node.digest;

    // another flight may have committed between our lookup and acquiring this one
    auto cached = lookup_cached(digest, session);
    if (!cached)
        return std::unexpected(cached.error());
    if (*cached)
        return std::move(**cached);

    std::vector<const Artifact *> inputs;
    inputs.reserve(node.inputs.size());
    for (NodeId in : node.inputs) {
        const Artifact *a = artifact(in);
        if (!a)
            return failf(ErrorKind::InvalidState, "input {} of '{}' has no artifact", in, label_of(node));
        inputs.push_back(a);
    }

    if (session.cancelled())
        return fail(ErrorKind::Cancelled, "build cancelled");

    RunRequest request{.name = label_of(node),
                       .instruction = node.instruction,
                       .inputs = std::move(inputs),
                       .env = &env_,
                       .stop = session.stop_token()};
    session.counters().runner_invocations++;
    ran = true;
    auto output = runner_.run(request);
    if (!output)
        return std::unexpected(output.error());

    if (session.cancelled())
        return fail(ErrorKind::Cancelled, "build cancelled, output discarded");

    Artifact artifact = Artifact::from_bytes(std::move(*output));
    if (auto ok = cache_.put(artifact.digest, artifact, session); !ok)
        return std::unexpected(ok.error());

    ActionRecord action{.node_digest = digest,
                        .output_digest = artifact.digest,
                        .size = artifact.size(),
                        .created_at = unix_now()};
    if (auto ok = cache_.record_action(action, session); !ok)
        return std::unexpected(ok.error());
    return artifact;
}

void Executor::report_progress(const Node &node, const NodeOutcome &outcome) {
    std::lock_guard lock(progress_mtx_);
    if (!node.dirty) {
        log::debug("       {} {}", to_string(outcome.status), label_of(node));
        return;
    }
    ++progress_done_;
    static const bool tty = ::isatty(STDOUT_FILENO) != 0;
    std::string_view bold = tty ? "\033[1m" : "";
    std::string_view green = tty ? "\033[1;32m" : "";
    std::string_view reset = tty ? "\033[0m" : "";
    if (config_.dry_run)
        log::info("{}[DRY RUN]{} {}{:>9}{} {}", bold, reset, green, to_string(outcome.status), reset, label_of(node));
    else
        log::info("{}[{}/{}]{} {}{:>9}{} {}", bold, progress_done_, progress_total_, reset, green,
                  to_string(outcome.status), reset, label_of(node));
}

} // namespace memobuild
