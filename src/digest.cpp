#include "memobuild/digest.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace memobuild {

namespace {

constexpr char hex_chars[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::string Digest::hex() const {
    std::string out;
    out.reserve(size * 2);
    for (uint8_t b : bytes) {
        out.push_back(hex_chars[b >> 4]);
        out.push_back(hex_chars[b & 0x0f]);
    }
    return out;
}

std::string Digest::short_hex() const {
    return hex().substr(0, 8);
}

Result<Digest> Digest::from_hex(std::string_view hex) {
    if (hex.size() != size * 2) {
        return failf(ErrorKind::ParseError, "Digest must be {} hex characters, got {}", size * 2, hex.size());
    }
    Digest d;
    for (size_t i = 0; i < size; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return failf(ErrorKind::ParseError, "Invalid hex digest: {}", hex);
        }
        d.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return d;
}

struct Hasher::Ctx {
    EVP_MD_CTX *md = nullptr;

    Ctx() : md(EVP_MD_CTX_new()) {
        if (!md || EVP_DigestInit_ex(md, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(md);
            throw std::runtime_error("Failed to initialise SHA-256 context");
        }
    }
    ~Ctx() {
        EVP_MD_CTX_free(md);
    }
};

Hasher::Hasher() : ctx_(std::make_unique<Ctx>()) {
}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher &&) noexcept = default;
Hasher &Hasher::operator=(Hasher &&) noexcept = default;

Hasher &Hasher::update(const void *data, size_t len) {
    if (len > 0)
        EVP_DigestUpdate(ctx_->md, data, len);
    return *this;
}

Hasher &Hasher::update_u64(uint64_t value) {
    // little-endian, independent of host byte order
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i)
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    return update(buf, sizeof(buf));
}

Hasher &Hasher::update_field(std::string_view data) {
    update_u64(data.size());
    return update(data);
}

Digest Hasher::finish() {
    Digest d;
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_->md, d.bytes.data(), &len);
    return d;
}

Digest sha256(std::string_view data) {
    return Hasher().update(data).finish();
}

Digest sha256(std::span<const uint8_t> data) {
    return Hasher().update(data.data(), data.size()).finish();
}

} // namespace memobuild
