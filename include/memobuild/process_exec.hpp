#pragma once

#include "memobuild/utility.hpp"

#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace memobuild {

struct ProcessOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

struct ProcessOptions {
    std::optional<std::string> working_dir;
    /// Extends (and overrides entries of) the parent environment.
    std::map<std::string, std::string> env;
    /// Fed to the child's stdin; the child sees EOF afterwards.
    std::string input;
    /// Checked while output is drained; a stop request terminates the child.
    std::stop_token stop;
};

/**
 * @brief Runs a subprocess to completion, capturing stdout and stderr.
 *
 * @param args The command line arguments (first argument is the executable).
 * @return The exit code and captured streams. A non-zero exit code is not an error here;
 *         failing to start the process is a RunnerError and a stop request is Cancelled.
 */
Result<ProcessOutput> process_exec(std::vector<std::string> args, const ProcessOptions &options = {});

} // namespace memobuild
