#include "memobuild/remote_store.hpp"

#include "memobuild/cache_server.hpp"
#include "memobuild/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <thread>

namespace memobuild {

namespace {

bool retryable_status(int status) {
    return status == 408 || status == 429 || status >= 500;
}

Error status_error(const HttpRequest &req, const HttpResponse &res) {
    std::string what = std::format("{} {} returned {}", to_string(req.method), req.path, res.status);
    if (!res.body.empty())
        what += ": " + res.body.substr(0, 200);
    return Error{ErrorKind::NetworkError, std::move(what), retryable_status(res.status)};
}

} // namespace

std::chrono::milliseconds base_backoff(const RetryPolicy &policy, uint32_t retry) {
    double ms = static_cast<double>(policy.initial_backoff.count()) *
                std::pow(policy.multiplier, static_cast<double>(retry > 0 ? retry - 1 : 0));
    ms = std::min(ms, static_cast<double>(policy.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

RemoteStore::RemoteStore(std::shared_ptr<HttpTransport> transport, RetryPolicy policy)
    : transport_(std::move(transport)), policy_(policy),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }), rng_(std::random_device{}()) {
}

std::chrono::milliseconds RemoteStore::jittered(std::chrono::milliseconds delay) {
    std::uniform_real_distribution<double> dist(1.0 - policy_.jitter, 1.0 + policy_.jitter);
    std::lock_guard lock(rng_mtx_);
    return std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(delay.count()) * dist(rng_)));
}

Result<HttpResponse> RemoteStore::call(HttpMethod method, std::string path, std::string body) {
    HttpRequest req;
    req.method = method;
    req.path = std::move(path);
    req.body = std::move(body);
    req.timeout = policy_.attempt_timeout;
    req.headers.emplace(std::string(api_version_header), std::string(api_version));

    Error last{ErrorKind::NetworkError, "no attempts made", false};
    uint32_t attempts = std::max<uint32_t>(policy_.max_attempts, 1);
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto res = transport_->send(req);
        if (res) {
            std::string version = res->header(api_version_header);
            if (version != api_version) {
                return failf(ErrorKind::NetworkError, "remote cache speaks api version '{}', expected {}", version,
                             api_version);
            }
            if (res->status == 401 || res->status == 403)
                return std::unexpected(status_error(req, *res));
            if (!retryable_status(res->status))
                return res;
            last = status_error(req, *res);
        } else {
            last = res.error();
            if (!last.retryable)
                return std::unexpected(last);
        }

        if (attempt < attempts) {
            auto delay = jittered(base_backoff(policy_, attempt));
            log::debug("{} {} failed ({}), retrying in {}ms", to_string(method), req.path, last.message, delay.count());
            sleeper_(delay);
        }
    }
    last.message = std::format("{} (after {} attempts)", last.message, attempts);
    return std::unexpected(last);
}

Result<bool> RemoteStore::has(const Digest &digest) {
    auto res = call(HttpMethod::Head, "/cache/" + digest.hex());
    if (!res)
        return std::unexpected(res.error());
    if (res->status == 200)
        return true;
    if (res->status == 404)
        return false;
    return failf(ErrorKind::NetworkError, "HEAD /cache/{} returned {}", digest.short_hex(), res->status);
}

Result<std::optional<Artifact>> RemoteStore::get(const Digest &digest) {
    auto res = call(HttpMethod::Get, "/cache/" + digest.hex());
    if (!res)
        return std::unexpected(res.error());
    if (res->status == 404)
        return std::nullopt;
    if (res->status != 200)
        return failf(ErrorKind::NetworkError, "GET /cache/{} returned {}", digest.short_hex(), res->status);

    if (auto ok = verify_content(digest, res->body); !ok)
        return std::unexpected(ok.error());
    return Artifact{digest, std::move(res->body)};
}

Result<void> RemoteStore::put(const Artifact &artifact) {
    if (auto ok = verify_content(artifact.digest, artifact.data); !ok)
        return std::unexpected(ok.error());

    auto res = call(HttpMethod::Put, "/cache/" + artifact.digest.hex(), artifact.data);
    if (!res)
        return std::unexpected(res.error());
    if (res->status == 200 || res->status == 201)
        return {};
    if (res->status == 400 && res->body.starts_with(to_string(ErrorKind::CASIntegrityFailure)))
        return failf(ErrorKind::CASIntegrityFailure, "remote rejected {}: {}", artifact.digest.short_hex(), res->body);
    return failf(ErrorKind::NetworkError, "PUT /cache/{} returned {}: {}", artifact.digest.short_hex(), res->status,
                 res->body);
}

Result<std::optional<ActionRecord>> RemoteStore::get_action(const Digest &node_digest) {
    auto res = call(HttpMethod::Get, "/action/" + node_digest.hex());
    if (!res)
        return std::unexpected(res.error());
    if (res->status == 404)
        return std::nullopt;
    if (res->status != 200)
        return failf(ErrorKind::NetworkError, "GET /action/{} returned {}", node_digest.short_hex(), res->status);

    auto record = ActionRecord::decode(res->body);
    if (!record)
        return std::unexpected(record.error());
    if (auto ok = verify_action(node_digest, *record); !ok)
        return std::unexpected(ok.error());
    return *record;
}

Result<void> RemoteStore::put_action(const ActionRecord &record) {
    auto res = call(HttpMethod::Put, "/action/" + record.node_digest.hex(), record.encode());
    if (!res)
        return std::unexpected(res.error());
    if (res->status == 200 || res->status == 201)
        return {};
    return failf(ErrorKind::NetworkError, "PUT /action/{} returned {}: {}", record.node_digest.short_hex(),
                 res->status, res->body);
}

Result<std::string> RemoteStore::gc(int days) {
    auto res = call(HttpMethod::Post, std::format("/gc?days={}", days));
    if (!res)
        return std::unexpected(res.error());
    if (res->status != 200)
        return failf(ErrorKind::NetworkError, "POST /gc returned {}: {}", res->status, res->body);
    return std::move(res->body);
}

Result<HttpResponse> LoopbackTransport::send(const HttpRequest &request) {
    return server_.handle(request);
}

} // namespace memobuild
