#include "memobuild/build_file.hpp"
#include "memobuild/config.hpp"
#include "memobuild/dirty.hpp"
#include "memobuild/executor.hpp"
#include "memobuild/interrupt.hpp"
#include "memobuild/log.hpp"
#include "memobuild/session_record.hpp"
#include "memobuild/worker_pool.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <string>

namespace {

void print_help() {
    std::println("Usage: memobuild [options]");
    std::println("Options:");
    std::println("  -h, --help              Show this help message");
    std::println("  --version               Show version");
    std::println("  -d <dir>                Change working directory before doing anything");
    std::println("  -f <file>               Use <file> as the build description (default: memobuild.json)");
    std::println("  -j, --jobs <N>          Set number of parallel jobs (default: auto)");
    std::println("  --keep-going            Keep building independent steps after a failure");
    std::println("  --dry-run               Report what would run without running it");
    std::println("  --cache-dir <dir>       Local cache directory (env: MEMOBUILD_CACHE_DIR)");
    std::println("  --remote <url>          Remote cache URL (env: MEMOBUILD_REMOTE_URL)");
    std::println("  --remote-policy <p>     disabled | read-only | read-write | required");
    std::println("  --runner <kind>         process | container (default: process)");
    std::println("  --image <image>         Image for the container runner");
    std::println("  --graph                 Print a DOT graph with dirty steps highlighted");
    std::println("  --report <file>         Write the build report as JSON");
    std::println("  --gc-days <N>           Remove cache entries older than N days and exit");
    std::println("  --gc-max-bytes <N>      Shrink the local cache to N bytes and exit");
    std::println("  -v, --verbose           Print cache and scheduling details");
    std::println("  -q, --quiet             Only print errors");
}

void print_version() {
    std::println("memobuild {}", MEMOBUILD_PROJ_VER);
}

template <typename T>
bool parse_number(const char *text, T &out) {
    auto res = std::from_chars(text, text + strlen(text), out);
    return res.ec == std::errc() && res.ptr == text + strlen(text);
}

int run_gc(memobuild::TieredCache &cache, std::optional<int> days, std::optional<uint64_t> max_bytes) {
    if (days) {
        auto stats = cache.local().gc_older_than(std::chrono::days(*days));
        if (!stats) {
            memobuild::log::error("gc failed: {}", stats.error());
            return 1;
        }
        memobuild::log::info("Removed {} entries ({} bytes) older than {} days", stats->removed, stats->bytes_freed,
                             *days);
        if (auto *remote = cache.remote(); remote && cache.policy() != memobuild::RemotePolicy::ReadOnly) {
            auto summary = remote->gc(*days);
            if (!summary)
                memobuild::log::warn("remote gc failed: {}", summary.error());
            else
                memobuild::log::info("Remote: {}", *summary);
        }
    }
    if (max_bytes) {
        auto stats = cache.local().gc_to_size(*max_bytes);
        if (!stats) {
            memobuild::log::error("gc failed: {}", stats.error());
            return 1;
        }
        memobuild::log::info("Evicted {} entries ({} bytes)", stats->removed, stats->bytes_freed);
    }
    return 0;
}

} // namespace

int main(const int argc, const char *const *argv) {
    memobuild::ExecutorConfig config;
    memobuild::CacheConfig cache_config;
    memobuild::RunnerConfig runner_config;
    bool graph = false;
    std::string input_path = "memobuild.json";
    std::filesystem::path work_dir = ".";
    std::optional<std::filesystem::path> report_path;
    std::optional<int> gc_days;
    std::optional<uint64_t> gc_max_bytes;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(stderr, "Missing argument for {}", arg);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            memobuild::log::set_level(memobuild::log::Level::Verbose);
        } else if (arg == "-q" || arg == "--quiet") {
            memobuild::log::set_level(memobuild::log::Level::Quiet);
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--keep-going") {
            config.failure_mode = memobuild::FailureMode::Isolated;
        } else if (arg == "--graph") {
            graph = true;
        } else if (arg == "-d" || arg == "-f" || arg == "--cache-dir" || arg == "--remote" || arg == "--image" ||
                   arg == "--report") {
            const char *value = next();
            if (!value)
                return 1;
            if (arg == "-d")
                work_dir = value;
            else if (arg == "-f")
                input_path = value;
            else if (arg == "--cache-dir")
                cache_config.dir = value;
            else if (arg == "--remote")
                cache_config.remote_url = value;
            else if (arg == "--image")
                runner_config.image = value;
            else
                report_path = value;
        } else if (arg == "--remote-policy") {
            const char *value = next();
            if (!value)
                return 1;
            auto policy = memobuild::parse_remote_policy(value);
            if (!policy) {
                std::println(stderr, "{}", policy.error());
                return 1;
            }
            cache_config.remote_policy = *policy;
        } else if (arg == "--runner") {
            const char *value = next();
            if (!value)
                return 1;
            auto kind = memobuild::parse_runner_kind(value);
            if (!kind) {
                std::println(stderr, "{}", kind.error());
                return 1;
            }
            runner_config.kind = *kind;
        } else if (arg == "-j" || arg == "--jobs") {
            const char *value = next();
            if (!value)
                return 1;
            if (!parse_number(value, config.jobs)) {
                std::println(stderr, "Invalid job count: {}", value);
                return 1;
            }
        } else if (arg == "--gc-days") {
            const char *value = next();
            int days = 0;
            if (!value || !parse_number(value, days) || days < 0) {
                std::println(stderr, "Invalid day count: {}", value ? value : "");
                return 1;
            }
            gc_days = days;
        } else if (arg == "--gc-max-bytes") {
            const char *value = next();
            uint64_t bytes = 0;
            if (!value || !parse_number(value, bytes)) {
                std::println(stderr, "Invalid byte count: {}", value ? value : "");
                return 1;
            }
            gc_max_bytes = bytes;
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(stderr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    // before any worker thread exists, so every thread inherits the blocked signals
    memobuild::BuildSession session;
    memobuild::InterruptWatch interrupts(session);

    if (auto res = memobuild::apply_environment(cache_config); !res) {
        std::println(stderr, "{}", res.error());
        return 1;
    }
    auto cache = memobuild::open_cache(cache_config);
    if (!cache) {
        std::println(stderr, "Failed to open cache: {}", cache.error());
        return 1;
    }

    if (gc_days || gc_max_bytes)
        return run_gc(**cache, gc_days, gc_max_bytes);

    if (!std::filesystem::exists(input_path)) {
        std::println(stderr, "Build File: {} does not exist.", input_path);
        return 1;
    }

    memobuild::WorkerPool fingerprint_pool(config.jobs);
    auto loaded = memobuild::load_build_file(input_path, &fingerprint_pool);
    if (!loaded) {
        std::println(stderr, "Failed to load {}: {}", input_path, loaded.error());
        return 1;
    }

    const std::filesystem::path session_path = std::filesystem::path(".memobuild") / "session.json";
    auto record = memobuild::SessionRecord::load(session_path);
    if (!record) {
        std::println(stderr, "{}", record.error());
        return 1;
    }

    if (graph) {
        if (auto res = memobuild::DirtyPropagator(*record).mark(loaded->graph); !res) {
            std::println(stderr, "{}", res.error());
            return 1;
        }
        std::print("{}", loaded->graph.emit_dot());
        return 0;
    }

    auto runner = memobuild::make_runner(runner_config);
    if (!runner) {
        std::println(stderr, "{}", runner.error());
        return 1;
    }

    memobuild::Executor executor{std::move(loaded->graph), **cache, std::move(*runner), std::move(loaded->env), config};
    auto report = executor.execute(session, *record);
    if (!report) {
        std::println(stderr, "Execution failed: {}", report.error());
        return 1;
    }

    report->print(executor.graph());
    if (report_path) {
        std::ofstream out(*report_path);
        out << report->to_json(executor.graph()).dump(4);
        if (!out)
            memobuild::log::warn("could not write report to {}", report_path->string());
    }

    if (!config.dry_run) {
        if (auto res = record->save(session_path); !res)
            memobuild::log::warn("could not save session record: {}", res.error());
    }

    if (report->cancelled)
        return 130;
    return report->success() ? 0 : 1;
}
