#pragma once

#include "memobuild/artifact.hpp"
#include "memobuild/remote_protocol.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>

namespace memobuild {

class CacheServer;

struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5000};
    double multiplier = 2.0;
    double jitter = 0.2; ///< Fraction of the delay added or removed at random.
    std::chrono::milliseconds attempt_timeout{30000};
};

/**
 * @brief Delay before retry number `retry` (1-based), before jitter is applied.
 *
 * initial * multiplier^(retry-1), capped at max_backoff.
 */
std::chrono::milliseconds base_backoff(const RetryPolicy &policy, uint32_t retry);

/**
 * @brief L3 tier client.
 *
 * Speaks the remote cache contract over an HttpTransport. Retryable NetworkErrors (no response,
 * 408, 429, 5xx) are retried with exponential backoff and jitter; everything else surfaces on
 * the first attempt. Downloaded blobs are verified before they are returned and uploads are
 * verified before they are sent.
 */
class RemoteStore {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RemoteStore(std::shared_ptr<HttpTransport> transport, RetryPolicy policy = {});

    /** @brief Replaces the sleep used between attempts (tests use a recording no-op). */
    void set_sleeper(Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
    }

    Result<bool> has(const Digest &digest);
    /** @return nullopt on 404; CASIntegrityFailure when the payload does not match `digest`. */
    Result<std::optional<Artifact>> get(const Digest &digest);
    Result<void> put(const Artifact &artifact);

    Result<std::optional<ActionRecord>> get_action(const Digest &node_digest);
    Result<void> put_action(const ActionRecord &record);

    /** @brief Asks the server to drop entries older than `days`; returns its JSON summary. */
    Result<std::string> gc(int days);

private:
    Result<HttpResponse> call(HttpMethod method, std::string path, std::string body = {});
    std::chrono::milliseconds jittered(std::chrono::milliseconds delay);

    std::shared_ptr<HttpTransport> transport_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    std::mutex rng_mtx_;
    std::mt19937_64 rng_;
};

/** @brief Calls a CacheServer in the same process. */
class LoopbackTransport : public HttpTransport {
public:
    explicit LoopbackTransport(CacheServer &server) : server_(server) {
    }

    Result<HttpResponse> send(const HttpRequest &request) override;

private:
    CacheServer &server_;
};

/**
 * @brief Reaches a remote cache over HTTP by running the `curl` executable.
 *
 * Bodies travel through temporary files; curl exit codes for resolve, connect, timeout and
 * receive failures map to retryable NetworkErrors.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string base_url, std::string curl = "curl");

    Result<HttpResponse> send(const HttpRequest &request) override;

private:
    std::string base_url_;
    std::string curl_;
};

} // namespace memobuild
