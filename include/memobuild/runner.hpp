#pragma once

#include "memobuild/artifact.hpp"
#include "memobuild/digest.hpp"
#include "memobuild/utility.hpp"

#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace memobuild {

/** @brief Execution environment every node digest is bound to. */
struct Environment {
    std::map<std::string, std::string> vars;
    std::string platform = host_platform();

    /** @brief Digest over the platform and the sorted variables. */
    Digest fingerprint() const;

    static std::string host_platform();
};

struct RunRequest {
    std::string_view name;
    std::string_view instruction;
    std::vector<const Artifact *> inputs; ///< In the node's input order.
    const Environment *env = nullptr;
    std::stop_token stop;
};

/** @return The bytes of the produced artifact. */
using RunFn = std::function<Result<std::string>(const RunRequest &)>;

/**
 * @brief The capability that turns an instruction and resolved inputs into output bytes.
 *
 * A thin wrapper around a callable; which callable is chosen by RunnerConfig.
 */
class Runner {
public:
    Runner(std::string kind, RunFn fn) : kind_(std::move(kind)), fn_(std::move(fn)) {
    }

    Result<std::string> run(const RunRequest &request) const;

    const std::string &kind() const {
        return kind_;
    }

private:
    std::string kind_;
    RunFn fn_;
};

enum class RunnerKind { Process, Container };

Result<RunnerKind> parse_runner_kind(std::string_view text);

struct RunnerConfig {
    RunnerKind kind = RunnerKind::Process;
    std::string shell = "/bin/sh";
    std::string container_engine = "docker";
    std::string image;
    std::optional<std::string> working_dir;
};

/**
 * @brief Runs `<shell> -c <instruction>` with the inputs concatenated on stdin; stdout is the
 * artifact and a non-zero exit status is a RunnerError.
 */
Runner make_process_runner(const RunnerConfig &config = {});

/** @brief Like the process runner, inside `<engine> run --rm -i <image>`. */
Result<Runner> make_container_runner(const RunnerConfig &config);

/** @brief Wraps an in-process callable. */
Runner make_function_runner(RunFn fn);

Result<Runner> make_runner(const RunnerConfig &config);

} // namespace memobuild
