#include "memobuild/graph.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <format>
#include <sstream>

namespace memobuild {

namespace {

constexpr int graph_snapshot_version = 1;

std::string dot_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

} // namespace

std::string_view to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Source:
        return "source";
    case NodeKind::Dependency:
        return "dependency";
    case NodeKind::Build:
        return "build";
    case NodeKind::Artifact:
        return "artifact";
    }
    return "build";
}

Result<NodeKind> parse_node_kind(std::string_view text) {
    if (text == "source")
        return NodeKind::Source;
    if (text == "dependency")
        return NodeKind::Dependency;
    if (text == "build")
        return NodeKind::Build;
    if (text == "artifact")
        return NodeKind::Artifact;
    return failf(ErrorKind::ParseError, "Unknown node kind: {}", text);
}

Result<NodeId> BuildGraph::add_node(NodeSpec spec) {
    const NodeId id = nodes_.size();
    for (NodeId in : spec.inputs) {
        if (in >= nodes_.size()) {
            return failf(ErrorKind::UnknownInput, "Node {} ({}) references unknown input {}", id, spec.name, in);
        }
    }
    // Inputs always have smaller ids at this point, so a new node cannot close a cycle;
    // late edges go through add_input, which checks.

    Node node;
    node.id = id;
    node.kind = spec.kind;
    node.inputs = std::move(spec.inputs);
    node.instruction = std::move(spec.instruction);
    node.context_fingerprint = spec.context_fingerprint;
    node.name = std::move(spec.name);
    node.source_path = std::move(spec.source_path);
    node.content = std::move(spec.content);

    for (NodeId in : node.inputs) {
        auto &deps = nodes_[in].dependents;
        if (std::find(deps.begin(), deps.end(), id) == deps.end())
            deps.push_back(id);
    }
    if (!node.name.empty())
        index_.emplace(node.name, id);
    nodes_.push_back(std::move(node));
    // existing digests do not depend on a new node
    levels_.reset();
    return id;
}

bool BuildGraph::reaches(NodeId from, NodeId target) const {
    std::vector<bool> seen(nodes_.size(), false);
    std::vector<NodeId> stack{from};
    while (!stack.empty()) {
        NodeId u = stack.back();
        stack.pop_back();
        if (u == target)
            return true;
        if (seen[u])
            continue;
        seen[u] = true;
        for (NodeId v : nodes_[u].inputs) {
            if (!seen[v])
                stack.push_back(v);
        }
    }
    return false;
}

Result<void> BuildGraph::add_input(NodeId node, NodeId input) {
    if (node >= nodes_.size()) {
        return failf(ErrorKind::UnknownInput, "Unknown node {}", node);
    }
    if (input >= nodes_.size()) {
        return failf(ErrorKind::UnknownInput, "Node {} ({}) references unknown input {}", node, nodes_[node].name, input);
    }
    // node -> input closes a cycle iff node is already among input's transitive inputs
    if (reaches(input, node)) {
        return failf(ErrorKind::CyclicDependency, "Adding input {} to {} ({}) creates a cycle", input, node,
                     nodes_[node].name);
    }

    nodes_[node].inputs.push_back(input);
    auto &deps = nodes_[input].dependents;
    if (std::find(deps.begin(), deps.end(), node) == deps.end())
        deps.push_back(node);
    invalidate();
    return {};
}

void BuildGraph::invalidate() {
    levels_.reset();
    reset_digests();
}

void BuildGraph::reset_digests() {
    for (auto &n : nodes_)
        n.digest.reset();
}

const std::vector<std::vector<NodeId>> &BuildGraph::topological_levels() const {
    if (levels_)
        return *levels_;

    // Kahn pass: a node is placed once all of its inputs are, one level above the deepest
    std::vector<size_t> level(nodes_.size(), 0);
    std::vector<size_t> pending(nodes_.size());
    std::vector<NodeId> ready;
    for (const auto &node : nodes_) {
        pending[node.id] = node.inputs.size();
        if (node.inputs.empty())
            ready.push_back(node.id);
    }

    std::vector<std::vector<NodeId>> levels;
    while (!ready.empty()) {
        NodeId u = ready.back();
        ready.pop_back();
        if (levels.size() <= level[u])
            levels.resize(level[u] + 1);
        for (NodeId d : nodes_[u].dependents) {
            const auto &inputs = nodes_[d].inputs;
            pending[d] -= static_cast<size_t>(std::count(inputs.begin(), inputs.end(), u));
            level[d] = std::max(level[d], level[u] + 1);
            if (pending[d] == 0)
                ready.push_back(d);
        }
    }
    for (NodeId id = 0; id < nodes_.size(); ++id)
        levels[level[id]].push_back(id);

    levels_ = std::move(levels);
    return *levels_;
}

Result<Digest> BuildGraph::compute_digest(NodeId id) {
    if (id >= nodes_.size()) {
        return failf(ErrorKind::UnknownInput, "Unknown node {}", id);
    }
    Node &node = nodes_[id];
    if (node.digest)
        return *node.digest;

    if (node.kind == NodeKind::Source && node.inputs.empty() && node.instruction.empty()) {
        node.digest = node.context_fingerprint;
        return *node.digest;
    }

    Hasher h;
    h.update("memobuild-node-v1");
    h.update_u64(node.inputs.size());
    for (NodeId in : node.inputs) {
        const auto &input_digest = nodes_[in].digest;
        if (!input_digest) {
            return failf(ErrorKind::InvalidState, "Digest of {} requested before its input {} was resolved", id, in);
        }
        h.update_digest(*input_digest);
    }
    h.update_field(node.instruction);
    h.update_digest(node.context_fingerprint);
    h.update_digest(environment_fingerprint_);

    node.digest = h.finish();
    return *node.digest;
}

Result<void> BuildGraph::compute_digests() {
    for (const auto &level : topological_levels()) {
        for (NodeId id : level) {
            if (auto res = compute_digest(id); !res)
                return std::unexpected(res.error());
        }
    }
    return {};
}

std::optional<NodeId> BuildGraph::find(std::string_view name) const {
    if (auto it = index_.find(std::string(name)); it != index_.end())
        return it->second;
    return std::nullopt;
}

std::vector<NodeId> BuildGraph::downstream_of(NodeId id) const {
    std::vector<bool> seen(nodes_.size(), false);
    std::vector<NodeId> stack(nodes_[id].dependents.begin(), nodes_[id].dependents.end());
    std::vector<NodeId> out;
    while (!stack.empty()) {
        NodeId u = stack.back();
        stack.pop_back();
        if (seen[u])
            continue;
        seen[u] = true;
        out.push_back(u);
        for (NodeId v : nodes_[u].dependents)
            stack.push_back(v);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string BuildGraph::emit_dot() const {
    std::ostringstream out;
    out << "digraph memobuild {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (const auto &node : nodes_) {
        std::string color = "0.9 0.9 0.9"; // light gray for sources
        if (node.kind != NodeKind::Source)
            color = node.dirty ? "green" : "white";

        std::string label = node.name.empty() ? std::format("#{}", node.id) : dot_escape(node.name);
        out << "  n" << node.id << " [label=\"" << label << "\", fillcolor=\"" << color << "\"];\n";
        for (NodeId dep : node.dependents) {
            out << "  n" << node.id << " -> n" << dep << ";\n";
        }
    }
    out << "}\n";
    return out.str();
}

nlohmann::json BuildGraph::to_json() const {
    using json = nlohmann::json;
    json doc;
    doc["version"] = graph_snapshot_version;
    doc["environment"] = environment_fingerprint_.hex();
    json nodes = json::array();
    for (const auto &n : nodes_) {
        json j;
        j["id"] = n.id;
        j["kind"] = to_string(n.kind);
        j["name"] = n.name;
        j["inputs"] = n.inputs;
        j["instruction"] = n.instruction;
        j["context"] = n.context_fingerprint.hex();
        if (!n.source_path.empty())
            j["source_path"] = n.source_path.string();
        if (n.content)
            j["content"] = *n.content;
        if (n.digest)
            j["digest"] = n.digest->hex();
        j["dirty"] = n.dirty;
        nodes.push_back(std::move(j));
    }
    doc["nodes"] = std::move(nodes);
    return doc;
}

Result<BuildGraph> BuildGraph::from_json(const nlohmann::json &doc) {
    try {
        if (doc.value("version", 0) != graph_snapshot_version) {
            return failf(ErrorKind::ParseError, "Unsupported graph snapshot version {}", doc.value("version", 0));
        }
        auto env = Digest::from_hex(doc.at("environment").get<std::string>());
        if (!env)
            return std::unexpected(env.error());

        BuildGraph graph(*env);
        // edges pointing forward were added with add_input; replay them afterwards
        std::vector<std::pair<NodeId, NodeId>> late_edges;
        for (const auto &j : doc.at("nodes")) {
            auto kind = parse_node_kind(j.at("kind").get<std::string>());
            if (!kind)
                return std::unexpected(kind.error());
            auto ctx = Digest::from_hex(j.at("context").get<std::string>());
            if (!ctx)
                return std::unexpected(ctx.error());

            const NodeId id = graph.size();
            NodeSpec spec{.kind = *kind,
                          .instruction = j.value("instruction", ""),
                          .context_fingerprint = *ctx,
                          .name = j.value("name", "")};
            // once one input is late, every following input is too, to keep the order
            bool deferring = false;
            for (NodeId in : j.at("inputs").get<std::vector<NodeId>>()) {
                deferring = deferring || in >= id;
                if (deferring)
                    late_edges.emplace_back(id, in);
                else
                    spec.inputs.push_back(in);
            }
            if (j.contains("source_path"))
                spec.source_path = j["source_path"].get<std::string>();
            if (j.contains("content"))
                spec.content = j["content"].get<std::string>();

            if (auto res = graph.add_node(std::move(spec)); !res)
                return std::unexpected(res.error());
            graph.nodes_[id].dirty = j.value("dirty", false);
        }
        for (auto [node, input] : late_edges) {
            if (auto res = graph.add_input(node, input); !res)
                return std::unexpected(res.error());
        }
        return graph;
    } catch (const nlohmann::json::exception &err) {
        return failf(ErrorKind::ParseError, "Malformed graph snapshot: {}", err.what());
    }
}

} // namespace memobuild
