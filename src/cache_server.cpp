#include "memobuild/cache_server.hpp"

#include "memobuild/log.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

namespace memobuild {

namespace {

constexpr std::string_view cache_prefix = "/cache/";
constexpr std::string_view action_prefix = "/action/";

HttpResponse error_response(int status, const Error &err) {
    return make_response(status, std::format("{}", err));
}

} // namespace

HttpResponse CacheServer::handle(const HttpRequest &request) {
    if (find_header(request.headers, api_version_header) != api_version) {
        return make_response(400, std::format("unsupported api version, expected {}", api_version));
    }

    std::string_view path = request.path;
    std::string_view query;
    if (auto q = path.find('?'); q != std::string_view::npos) {
        query = path.substr(q + 1);
        path = path.substr(0, q);
    }

    if (path == "/gc")
        return request.method == HttpMethod::Post ? handle_gc(request, query) : make_response(405);

    bool is_blob = path.starts_with(cache_prefix);
    bool is_action = path.starts_with(action_prefix);
    if (!is_blob && !is_action)
        return make_response(404);

    auto digest = Digest::from_hex(path.substr(is_blob ? cache_prefix.size() : action_prefix.size()));
    if (!digest)
        return error_response(400, digest.error());

    return is_blob ? handle_blob(request, *digest) : handle_action(request, *digest);
}

HttpResponse CacheServer::handle_blob(const HttpRequest &request, const Digest &digest) {
    switch (request.method) {
    case HttpMethod::Head:
        return make_response(store_.has(digest) ? 200 : 404);
    case HttpMethod::Get: {
        auto artifact = store_.get(digest);
        if (artifact)
            return make_response(200, std::move(artifact->data));
        // a corrupt blob was just dropped; for the client it is simply absent
        if (artifact.error().is(ErrorKind::CacheMiss) || artifact.error().is(ErrorKind::CASIntegrityFailure))
            return make_response(404);
        return error_response(500, artifact.error());
    }
    case HttpMethod::Put: {
        auto stored = store_.put(digest, request.body);
        if (stored)
            return make_response(201);
        if (stored.error().is(ErrorKind::CASIntegrityFailure)) {
            log::warn("rejected upload for {}: {}", digest.short_hex(), stored.error().message);
            return error_response(400, stored.error());
        }
        return error_response(500, stored.error());
    }
    case HttpMethod::Post:
        break;
    }
    return make_response(405);
}

HttpResponse CacheServer::handle_action(const HttpRequest &request, const Digest &digest) {
    switch (request.method) {
    case HttpMethod::Head:
        return make_response(store_.has_action(digest) ? 200 : 404);
    case HttpMethod::Get: {
        auto record = store_.get_action(digest);
        if (record)
            return make_response(200, record->encode());
        if (record.error().is(ErrorKind::CacheMiss))
            return make_response(404);
        return error_response(500, record.error());
    }
    case HttpMethod::Put: {
        auto record = ActionRecord::decode(request.body);
        if (!record)
            return error_response(400, record.error());
        if (auto ok = verify_action(digest, *record); !ok)
            return error_response(400, ok.error());
        if (auto ok = store_.put_action(*record); !ok)
            return error_response(500, ok.error());
        return make_response(201);
    }
    case HttpMethod::Post:
        break;
    }
    return make_response(405);
}

HttpResponse CacheServer::handle_gc(const HttpRequest &, std::string_view query) {
    int days = 7;
    if (query.starts_with("days=")) {
        std::string_view value = query.substr(5);
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), days);
        if (ec != std::errc() || days < 0)
            return make_response(400, "invalid days parameter");
    }

    auto stats = store_.gc_older_than(std::chrono::days(days));
    if (!stats)
        return error_response(500, stats.error());

    nlohmann::json body = {{"removed", stats->removed}, {"bytes_freed", stats->bytes_freed}};
    return make_response(200, body.dump());
}

} // namespace memobuild
