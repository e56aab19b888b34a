#include "memobuild/dirty.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace memobuild {

bool DirtySet::contains(NodeId id) const {
    return std::binary_search(dirty.begin(), dirty.end(), id);
}

std::vector<std::string> logical_keys(const BuildGraph &graph) {
    std::vector<std::string> keys(graph.size());
    std::unordered_map<std::string, size_t> seen;

    // level order guarantees input keys exist before they are referenced
    for (const auto &level : graph.topological_levels()) {
        for (NodeId id : level) {
            const Node &node = graph.node(id);
            std::string key;
            if (!node.name.empty()) {
                key = node.name;
            } else {
                Hasher h;
                h.update_field(to_string(node.kind));
                h.update_field(node.instruction);
                h.update_u64(node.inputs.size());
                for (NodeId in : node.inputs)
                    h.update_field(keys[in]);
                key = "sig:" + h.finish().hex();
            }
            keys[id] = std::move(key);
        }
    }

    // disambiguate duplicates in id order, independent of level layout
    for (NodeId id = 0; id < keys.size(); ++id) {
        size_t n = seen[keys[id]]++;
        if (n > 0)
            keys[id] = std::format("{}#{}", keys[id], n);
    }
    return keys;
}

Result<DirtySet> DirtyPropagator::mark(BuildGraph &graph) const {
    graph.reset_digests();
    if (auto res = graph.compute_digests(); !res)
        return std::unexpected(res.error());

    const auto keys = logical_keys(graph);
    DirtySet result;
    std::vector<bool> dirty(graph.size(), false);

    for (const auto &level : graph.topological_levels()) {
        for (NodeId id : level) {
            const Node &node = graph.node(id);
            auto previous = previous_.lookup(keys[id]);
            bool changed = !previous || *previous != *node.digest;
            if (changed)
                result.seeds.push_back(id);

            bool input_dirty = std::any_of(node.inputs.begin(), node.inputs.end(), [&](NodeId in) { return dirty[in]; });
            dirty[id] = changed || input_dirty;
            graph.set_dirty(id, dirty[id]);
        }
    }

    std::sort(result.seeds.begin(), result.seeds.end());
    for (NodeId id = 0; id < dirty.size(); ++id) {
        if (dirty[id])
            result.dirty.push_back(id);
    }
    return result;
}

void update_record(SessionRecord &record, const BuildGraph &graph, const std::vector<NodeId> &resolved) {
    const auto keys = logical_keys(graph);
    for (NodeId id : resolved) {
        if (const auto &digest = graph.node(id).digest)
            record.record(keys[id], *digest);
    }
}

} // namespace memobuild
