#pragma once

#include "memobuild/digest.hpp"
#include "memobuild/utility.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memobuild {

using NodeId = size_t;

enum class NodeKind : uint8_t { Source, Dependency, Build, Artifact };

std::string_view to_string(NodeKind kind);
Result<NodeKind> parse_node_kind(std::string_view text);

/** @brief Arguments of Graph::add_node. */
struct NodeSpec {
    NodeKind kind = NodeKind::Build;
    std::vector<NodeId> inputs;
    std::string instruction;
    Digest context_fingerprint;
    std::string name; ///< Stable logical identity across sessions (path or step label).
    std::filesystem::path source_path; ///< Filesystem origin of a Source node, if any.
    std::optional<std::string> content; ///< Inline payload of a Source node, if any.
};

/**
 * @brief Represents one build step in the graph arena.
 *
 * Everything except `digest` and `dirty` is fixed once the node is added.
 */
struct Node {
    NodeId id = 0;
    NodeKind kind = NodeKind::Build;
    std::vector<NodeId> inputs;     ///< Ordered; order participates in the digest.
    std::vector<NodeId> dependents; ///< Nodes listing this one as an input.
    std::string instruction;
    Digest context_fingerprint;
    std::string name;
    std::filesystem::path source_path;
    std::optional<std::string> content;

    std::optional<Digest> digest;
    bool dirty = false;
};

/**
 * @brief Acyclic build graph stored as a flat arena addressed by NodeId.
 *
 * Edges are id lists; ids are never reused. The graph is built single-threaded and only read
 * concurrently afterwards.
 */
class BuildGraph {
public:
    explicit BuildGraph(Digest environment_fingerprint = {}) : environment_fingerprint_(environment_fingerprint) {
    }

    /**
     * @brief Adds a node whose inputs already exist.
     * @return The new id, or UnknownInput / CyclicDependency.
     */
    Result<NodeId> add_node(NodeSpec spec);

    Result<NodeId> add_node(NodeKind kind, std::vector<NodeId> inputs, std::string instruction,
                            Digest context_fingerprint, std::string name = {}) {
        return add_node(NodeSpec{.kind = kind,
                                 .inputs = std::move(inputs),
                                 .instruction = std::move(instruction),
                                 .context_fingerprint = context_fingerprint,
                                 .name = std::move(name)});
    }

    /**
     * @brief Appends a late-discovered input edge to an existing node.
     *
     * The cycle check only walks the inputs reachable from `input`. On failure the graph is
     * left unchanged.
     */
    Result<void> add_input(NodeId node, NodeId input);

    /**
     * @brief Nodes grouped by depth: level 0 has no inputs, level k has inputs up to level k-1.
     *
     * Computed on first use and cached until the node or edge set changes.
     */
    const std::vector<std::vector<NodeId>> &topological_levels() const;

    /**
     * @brief Digest of one node; every input must already have its digest.
     *
     * Memoized. Source nodes without inputs or instruction take their context fingerprint
     * verbatim, so a source's digest is also the CAS key of its content.
     */
    Result<Digest> compute_digest(NodeId id);

    /** @brief Computes every digest in level order. */
    Result<void> compute_digests();

    /** @brief Drops memoized digests, e.g. after a context fingerprint was refreshed. */
    void reset_digests();

    void set_dirty(NodeId id, bool dirty) {
        nodes_[id].dirty = dirty;
    }

    const Node &node(NodeId id) const {
        return nodes_[id];
    }
    const std::vector<Node> &nodes() const {
        return nodes_;
    }
    size_t size() const {
        return nodes_.size();
    }

    std::optional<NodeId> find(std::string_view name) const;

    /** @brief All nodes reachable from `id` through dependent edges, excluding `id`. */
    std::vector<NodeId> downstream_of(NodeId id) const;

    const Digest &environment_fingerprint() const {
        return environment_fingerprint_;
    }

    /** @brief Graphviz rendering; dirty nodes are filled green like stale targets. */
    std::string emit_dot() const;

    nlohmann::json to_json() const;
    static Result<BuildGraph> from_json(const nlohmann::json &doc);

private:
    void invalidate();
    bool reaches(NodeId from, NodeId target) const;

    std::vector<Node> nodes_;
    std::unordered_map<std::string, NodeId> index_;
    Digest environment_fingerprint_;
    mutable std::optional<std::vector<std::vector<NodeId>>> levels_;
};

} // namespace memobuild
