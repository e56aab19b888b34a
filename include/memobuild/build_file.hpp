#pragma once

#include "memobuild/graph.hpp"
#include "memobuild/runner.hpp"
#include "memobuild/utility.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>

namespace memobuild {

class WorkerPool;

struct LoadedBuild {
    BuildGraph graph;
    Environment env;
    std::filesystem::path root; ///< Directory relative source paths resolve against.
};

/**
 * @brief Turns a build description into a graph.
 *
 * Format:
 * @code
 * { "version": 1,
 *   "env": { "CC": "gcc" },
 *   "platform": "linux-x86_64",            (optional, defaults to the host)
 *   "steps": [
 *     { "name": "src", "source": "src" },  (file or directory, fingerprinted)
 *     { "name": "msg", "content": "hi" },  (inline bytes)
 *     { "name": "out", "kind": "build", "inputs": ["src", "msg"], "instruction": "cat" } ] }
 * @endcode
 * Inputs may only name earlier steps.
 */
Result<LoadedBuild> parse_build_description(const nlohmann::json &doc, const std::filesystem::path &root,
                                            WorkerPool *pool = nullptr);

/** @brief Reads and parses `path`; relative sources resolve against its directory. */
Result<LoadedBuild> load_build_file(const std::filesystem::path &path, WorkerPool *pool = nullptr);

} // namespace memobuild
