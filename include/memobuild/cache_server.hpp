#pragma once

#include "memobuild/local_store.hpp"
#include "memobuild/remote_protocol.hpp"

namespace memobuild {

/**
 * @brief Server side of the remote cache contract, backed by a LocalStore.
 *
 *   HEAD /cache/{digest}   200 | 404
 *   GET  /cache/{digest}   200 + bytes | 404
 *   PUT  /cache/{digest}   201 | 400 "CASIntegrityFailure: ..." (nothing stored)
 *   HEAD|GET|PUT /action/{digest}   same, JSON action record bodies
 *   POST /gc?days=N        200 + JSON {removed, bytes_freed}
 *
 * Requests without the matching api version header get 400. Transport-independent: an HTTP
 * frontend or LoopbackTransport feeds it requests.
 */
class CacheServer {
public:
    explicit CacheServer(LocalStore &store) : store_(store) {
    }

    HttpResponse handle(const HttpRequest &request);

private:
    HttpResponse handle_blob(const HttpRequest &request, const Digest &digest);
    HttpResponse handle_action(const HttpRequest &request, const Digest &digest);
    HttpResponse handle_gc(const HttpRequest &request, std::string_view query);

    LocalStore &store_;
};

} // namespace memobuild
