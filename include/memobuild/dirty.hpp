#pragma once

#include "memobuild/graph.hpp"
#include "memobuild/session_record.hpp"
#include "memobuild/utility.hpp"

#include <string>
#include <vector>

namespace memobuild {

/**
 * @brief Stable identity of every node, independent of its numeric id.
 *
 * Named nodes use their name. Unnamed nodes use a signature of kind, instruction and their
 * inputs' identities. Repeated identities get a "#n" suffix in id order.
 */
std::vector<std::string> logical_keys(const BuildGraph &graph);

struct DirtySet {
    std::vector<NodeId> seeds; ///< Nodes whose own digest changed or that are new.
    std::vector<NodeId> dirty; ///< Seeds plus everything downstream of them, ascending.

    bool contains(NodeId id) const;
};

/**
 * @brief Decides which nodes need to run by comparing fresh digests with the last session.
 *
 * Digests are (re)computed bottom-up first; since each digest folds in its inputs' digests, a
 * change anywhere upstream already shows up as a digest change. Dependents of seeds are still
 * marked explicitly so that a node whose record happens to match is never left clean below a
 * dirty input.
 */
class DirtyPropagator {
public:
    explicit DirtyPropagator(const SessionRecord &previous) : previous_(previous) {
    }

    Result<DirtySet> mark(BuildGraph &graph) const;

private:
    const SessionRecord &previous_;
};

/**
 * @brief Stores the digests of `resolved` nodes into `record`, leaving other entries untouched.
 */
void update_record(SessionRecord &record, const BuildGraph &graph, const std::vector<NodeId> &resolved);

} // namespace memobuild
