#include "memobuild/runner.hpp"

#include "memobuild/log.hpp"
#include "memobuild/process_exec.hpp"

#include <sys/utsname.h>

namespace memobuild {

namespace {

constexpr size_t stderr_excerpt = 2000;

std::string concat_inputs(const std::vector<const Artifact *> &inputs) {
    size_t total = 0;
    for (const Artifact *a : inputs)
        total += a->size();
    std::string joined;
    joined.reserve(total);
    for (const Artifact *a : inputs)
        joined += a->data;
    return joined;
}

Result<std::string> run_shell(std::vector<std::string> args, const RunnerConfig &config, const RunRequest &req) {
    ProcessOptions options;
    options.working_dir = config.working_dir;
    if (req.env)
        options.env = req.env->vars;
    options.input = concat_inputs(req.inputs);
    options.stop = req.stop;

    auto result = process_exec(std::move(args), options);
    if (!result)
        return std::unexpected(result.error());

    if (!result->err.empty())
        log::debug("{}: {}", req.name, result->err);
    if (result->exit_code != 0) {
        std::string_view err = result->err;
        if (err.size() > stderr_excerpt)
            err = err.substr(err.size() - stderr_excerpt);
        return failf(ErrorKind::RunnerError, "'{}' exited with {}{}{}", req.instruction, result->exit_code,
                     err.empty() ? "" : "\n", err);
    }
    return std::move(result->out);
}

} // namespace

std::string Environment::host_platform() {
    struct utsname info;
    if (::uname(&info) != 0)
        return "unknown";
    return std::format("{}-{}", info.sysname, info.machine);
}

Digest Environment::fingerprint() const {
    Hasher h;
    h.update_field("memobuild-env-v1");
    h.update_field(platform);
    h.update_u64(vars.size());
    for (const auto &[key, value] : vars) {
        h.update_field(key);
        h.update_field(value);
    }
    return h.finish();
}

Result<std::string> Runner::run(const RunRequest &request) const {
    if (request.stop.stop_requested())
        return failf(ErrorKind::Cancelled, "{} cancelled before start", request.name);
    return fn_(request);
}

Result<RunnerKind> parse_runner_kind(std::string_view text) {
    if (text == "process")
        return RunnerKind::Process;
    if (text == "container")
        return RunnerKind::Container;
    return failf(ErrorKind::ParseError, "Unknown runner '{}' (expected process or container)", text);
}

Runner make_process_runner(const RunnerConfig &config) {
    return Runner("process", [config](const RunRequest &req) {
        return run_shell({config.shell, "-c", std::string(req.instruction)}, config, req);
    });
}

Result<Runner> make_container_runner(const RunnerConfig &config) {
    if (config.image.empty())
        return fail(ErrorKind::InvalidState, "Container runner requires an image");

    return Runner("container", [config](const RunRequest &req) {
        std::vector<std::string> args = {config.container_engine, "run", "--rm", "-i"};
        if (req.env) {
            for (const auto &[key, value] : req.env->vars) {
                args.push_back("-e");
                args.push_back(key + "=" + value);
            }
        }
        args.push_back(config.image);
        args.push_back(config.shell);
        args.push_back("-c");
        args.push_back(std::string(req.instruction));

        // variables go into the container, not to the engine process
        RunRequest outer = req;
        outer.env = nullptr;
        return run_shell(std::move(args), config, outer);
    });
}

Runner make_function_runner(RunFn fn) {
    return Runner("function", std::move(fn));
}

Result<Runner> make_runner(const RunnerConfig &config) {
    switch (config.kind) {
    case RunnerKind::Process:
        return make_process_runner(config);
    case RunnerKind::Container:
        return make_container_runner(config);
    }
    return fail(ErrorKind::InvalidState, "Unknown runner kind");
}

} // namespace memobuild
