#pragma once

#include "memobuild/utility.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace memobuild {

/** @brief 256-bit content digest (SHA-256). Used as node identity and as cache key. */
struct Digest {
    static constexpr size_t size = 32;
    std::array<uint8_t, size> bytes{};

    std::string hex() const;
    /** @brief First 8 hex characters, for progress output. */
    std::string short_hex() const;

    static Result<Digest> from_hex(std::string_view hex);

    bool operator==(const Digest &) const = default;
    auto operator<=>(const Digest &) const = default;
};

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface.
 *
 * Every `update_*` helper other than `update` frames its argument with a length prefix so
 * that concatenated fields cannot alias each other.
 */
class Hasher {
public:
    Hasher();
    ~Hasher();
    Hasher(Hasher &&) noexcept;
    Hasher &operator=(Hasher &&) noexcept;
    Hasher(const Hasher &) = delete;
    Hasher &operator=(const Hasher &) = delete;

    Hasher &update(const void *data, size_t len);
    Hasher &update(std::string_view data) {
        return update(data.data(), data.size());
    }
    Hasher &update_u64(uint64_t value);
    Hasher &update_field(std::string_view data);
    Hasher &update_digest(const Digest &d) {
        return update(d.bytes.data(), d.bytes.size());
    }

    Digest finish();

private:
    struct Ctx;
    std::unique_ptr<Ctx> ctx_;
};

Digest sha256(std::string_view data);
Digest sha256(std::span<const uint8_t> data);

} // namespace memobuild

template <>
struct std::hash<memobuild::Digest> {
    size_t operator()(const memobuild::Digest &d) const noexcept {
        size_t h;
        std::memcpy(&h, d.bytes.data(), sizeof(h));
        return h;
    }
};
