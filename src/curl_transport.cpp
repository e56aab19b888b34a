#include "memobuild/remote_store.hpp"

#include "memobuild/log.hpp"
#include "memobuild/mmap.hpp"
#include "memobuild/process_exec.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace memobuild {

namespace {

std::atomic<uint64_t> scratch_counter{0};

// Removes the scratch files of one request, whatever the outcome.
class ScratchFiles {
public:
    ScratchFiles() {
        auto base = fs::temp_directory_path() / std::format("memobuild-curl-{}-{}", ::getpid(), scratch_counter++);
        request = base;
        request += ".req";
        response = base;
        response += ".body";
        headers = base;
        headers += ".hdr";
    }

    ~ScratchFiles() {
        std::error_code ec;
        fs::remove(request, ec);
        fs::remove(response, ec);
        fs::remove(headers, ec);
    }

    fs::path request;
    fs::path response;
    fs::path headers;
};

bool retryable_curl_exit(int code) {
    switch (code) {
    case 5:  // couldn't resolve proxy
    case 6:  // couldn't resolve host
    case 7:  // failed to connect
    case 28: // timeout
    case 52: // empty reply
    case 55: // send error
    case 56: // receive error
        return true;
    default:
        return false;
    }
}

std::string read_all(const fs::path &path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return {};
    try {
        MappedFile file(path);
        return std::string(file.content());
    } catch (const std::runtime_error &err) {
        log::debug("curl transport: {}", err.what());
        return {};
    }
}

// Keeps the header block of the final response only (curl also records 100-continue blocks).
std::map<std::string, std::string> parse_headers(const std::string &raw) {
    std::map<std::string, std::string> headers;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.starts_with("HTTP/")) {
            headers.clear();
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        headers[line.substr(0, colon)] = value;
    }
    return headers;
}

} // namespace

CurlTransport::CurlTransport(std::string base_url, std::string curl) : base_url_(std::move(base_url)), curl_(std::move(curl)) {
    while (base_url_.ends_with('/'))
        base_url_.pop_back();
}

Result<HttpResponse> CurlTransport::send(const HttpRequest &request) {
    ScratchFiles scratch;
    auto seconds = std::max<int64_t>(1, std::chrono::ceil<std::chrono::seconds>(request.timeout).count());

    std::vector<std::string> args = {curl_, "-sS", "--max-time", std::to_string(seconds), "-D", scratch.headers.string(),
                                     "-o", scratch.response.string(), "-w", "%{http_code}"};
    if (request.method == HttpMethod::Head) {
        args.push_back("--head");
    } else {
        args.push_back("-X");
        args.push_back(std::string(to_string(request.method)));
    }
    for (const auto &[key, value] : request.headers) {
        args.push_back("-H");
        args.push_back(key + ": " + value);
    }
    if (request.method == HttpMethod::Put || request.method == HttpMethod::Post) {
        std::ofstream out(scratch.request, std::ios::binary | std::ios::trunc);
        out.write(request.body.data(), static_cast<std::streamsize>(request.body.size()));
        if (!out)
            return failf(ErrorKind::NetworkError, "Failed to stage request body in {}", scratch.request.string());
        out.close();
        args.push_back("-H");
        args.push_back("Content-Type: application/octet-stream");
        args.push_back("--data-binary");
        args.push_back("@" + scratch.request.string());
    }
    args.push_back(base_url_ + request.path);

    auto result = process_exec(std::move(args));
    if (!result)
        return fail(ErrorKind::NetworkError, result.error().message);
    if (result->exit_code != 0) {
        return fail(ErrorKind::NetworkError,
                    std::format("curl exited with {}: {}", result->exit_code, result->err),
                    retryable_curl_exit(result->exit_code));
    }

    HttpResponse response;
    const std::string &code = result->out;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), response.status);
    if (ec != std::errc())
        return failf(ErrorKind::NetworkError, "curl reported unparsable status '{}'", code);
    response.headers = parse_headers(read_all(scratch.headers));
    if (request.method != HttpMethod::Head)
        response.body = read_all(scratch.response);
    return response;
}

} // namespace memobuild
