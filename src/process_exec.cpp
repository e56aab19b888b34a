#include "memobuild/process_exec.hpp"

#include "memobuild/log.hpp"

#include <reproc++/reproc.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <system_error>
#include <tuple>

namespace memobuild {

namespace {

constexpr reproc::milliseconds stop_poll_interval{100};

struct FileCloser {
    void operator()(FILE *f) const {
        std::fclose(f);
    }
};

} // namespace

Result<ProcessOutput> process_exec(std::vector<std::string> args, const ProcessOptions &opts) {
    if (args.empty()) {
        return fail(ErrorKind::RunnerError, "Cannot execute empty command");
    }

    reproc::options options;
    options.redirect.out.type = reproc::redirect::pipe;
    options.redirect.err.type = reproc::redirect::pipe;

    if (opts.working_dir) {
        options.working_directory = opts.working_dir->c_str();
    }

    std::vector<std::string> env_strings;
    std::vector<const char *> env_ptrs;
    if (!opts.env.empty()) {
        options.env.behavior = reproc::env::extend;
        for (const auto &[key, value] : opts.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (const auto &s : env_strings) {
            env_ptrs.push_back(s.c_str());
        }
        env_ptrs.push_back(nullptr);
        options.env.extra = env_ptrs.data();
    }

    // stdin comes from an anonymous file so a child that writes before it finishes reading
    // cannot deadlock against us
    std::unique_ptr<FILE, FileCloser> input(std::tmpfile());
    if (!input) {
        return fail(ErrorKind::RunnerError, "Failed to create stdin buffer");
    }
    if (!opts.input.empty() && std::fwrite(opts.input.data(), 1, opts.input.size(), input.get()) != opts.input.size()) {
        return fail(ErrorKind::RunnerError, "Failed to buffer process input");
    }
    std::fflush(input.get());
    std::rewind(input.get());
    options.redirect.in.file = input.get();

    reproc::process process;
    std::error_code ec = process.start(args, options);
    if (ec) {
        return failf(ErrorKind::RunnerError, "Failed to start '{}': {}", args.front(), ec.message());
    }

    ProcessOutput output;
    bool out_open = true;
    bool err_open = true;
    uint8_t buffer[4096];

    // the stop token is checked at least once per stop_poll_interval, output or not
    while (out_open || err_open) {
        if (opts.stop.stop_requested()) {
            reproc::stop_actions stop = {
                {reproc::stop::terminate, reproc::milliseconds(1000)},
                {reproc::stop::kill, reproc::infinite},
                {},
            };
            auto [status, stop_ec] = process.stop(stop);
            if (stop_ec)
                log::debug("stopping '{}' failed: {}", args.front(), stop_ec.message());
            return failf(ErrorKind::Cancelled, "'{}' cancelled", args.front());
        }

        int interests = (out_open ? reproc::event::out : 0) | (err_open ? reproc::event::err : 0);
        auto [events, poll_ec] = process.poll(interests, stop_poll_interval);
        if (poll_ec == std::errc::timed_out)
            continue;
        if (poll_ec == std::errc::broken_pipe)
            break;
        if (poll_ec) {
            return failf(ErrorKind::RunnerError, "Failed to read output of '{}': {}", args.front(), poll_ec.message());
        }

        for (auto [event, stream, open, target] :
             {std::tuple{reproc::event::out, reproc::stream::out, &out_open, &output.out},
              std::tuple{reproc::event::err, reproc::stream::err, &err_open, &output.err}}) {
            if (!(events & event))
                continue;
            auto [size, read_ec] = process.read(stream, buffer, sizeof(buffer));
            if (read_ec == std::errc::broken_pipe) {
                *open = false;
            } else if (read_ec) {
                return failf(ErrorKind::RunnerError, "Failed to read output of '{}': {}", args.front(),
                             read_ec.message());
            } else {
                target->append(reinterpret_cast<const char *>(buffer), size);
            }
        }
    }

    auto [status, wait_ec] = process.wait(reproc::infinite);
    if (wait_ec) {
        return failf(ErrorKind::RunnerError, "Failed to wait for '{}': {}", args.front(), wait_ec.message());
    }
    output.exit_code = status;
    return output;
}

} // namespace memobuild
