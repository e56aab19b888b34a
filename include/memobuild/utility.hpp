#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace memobuild {

enum class ErrorKind : uint8_t {
    FilesystemError,
    CyclicDependency,
    UnknownInput,
    CacheMiss,
    CASIntegrityFailure,
    NetworkError,
    RunnerError,
    InvalidState,
    ParseError,
    Cancelled,
    StorageError,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief Error value carried by every fallible operation.
 *
 * `retryable` is only meaningful for `NetworkError`; every other kind is final.
 */
struct Error {
    ErrorKind kind = ErrorKind::InvalidState;
    std::string message;
    bool retryable = false;

    bool is(ErrorKind k) const {
        return kind == k;
    }
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message, bool retryable = false) {
    return std::unexpected(Error{kind, std::move(message), retryable});
}

template <typename... Args>
std::unexpected<Error> failf(ErrorKind kind, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{kind, std::format(fmt, std::forward<Args>(args)...), false});
}

} // namespace memobuild

template <>
struct std::formatter<memobuild::Error> : std::formatter<std::string_view> {
    auto format(const memobuild::Error &err, std::format_context &ctx) const {
        return std::format_to(ctx.out(), "{}: {}", memobuild::to_string(err.kind), err.message);
    }
};
