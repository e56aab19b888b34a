#include "memobuild/remote_protocol.hpp"

#include <algorithm>
#include <cctype>

namespace memobuild {

std::string_view to_string(HttpMethod method) {
    switch (method) {
    case HttpMethod::Head:
        return "HEAD";
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Put:
        return "PUT";
    case HttpMethod::Post:
        return "POST";
    }
    return "GET";
}

std::string find_header(const std::map<std::string, std::string> &headers, std::string_view name) {
    auto iequal = [](std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    };
    for (const auto &[key, value] : headers) {
        if (iequal(key, name))
            return value;
    }
    return {};
}

std::string HttpResponse::header(std::string_view name) const {
    return find_header(headers, name);
}

HttpResponse make_response(int status, std::string body) {
    HttpResponse res;
    res.status = status;
    res.headers.emplace(std::string(api_version_header), std::string(api_version));
    res.body = std::move(body);
    return res;
}

} // namespace memobuild
