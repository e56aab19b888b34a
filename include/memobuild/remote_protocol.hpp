#pragma once

#include "memobuild/utility.hpp"

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace memobuild {

/// Every request and response carries this header; peers reject other versions.
inline constexpr std::string_view api_version_header = "X-MemoBuild-API-Version";
inline constexpr std::string_view api_version = "1";

enum class HttpMethod { Head, Get, Put, Post };

std::string_view to_string(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string path; ///< Path plus optional query, e.g. "/cache/<hex>" or "/gc?days=7".
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(std::string_view name) const;
};

/**
 * @brief Moves one request to the remote cache and back.
 *
 * Failing to get any response (refused connection, timeout, reset) is a retryable
 * NetworkError. A response of any status is a success at this level.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest &request) = 0;
};

HttpResponse make_response(int status, std::string body = {});

/** @brief Case-insensitive header lookup. */
std::string find_header(const std::map<std::string, std::string> &headers, std::string_view name);

} // namespace memobuild
