#pragma once

#include "memobuild/digest.hpp"
#include "memobuild/ignore.hpp"
#include "memobuild/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace memobuild {

class WorkerPool;

inline constexpr size_t fingerprint_chunk_size = 64 * 1024;

/** @brief One file of a fingerprinted tree. `path` is relative to the root and uses '/'. */
struct ManifestEntry {
    std::string path;
    Digest digest;
    uint64_t size = 0;
};

struct TreeFingerprint {
    Digest digest;
    std::vector<ManifestEntry> entries;
};

/**
 * @brief Digest of a byte payload.
 *
 * Payloads up to `fingerprint_chunk_size` hash to plain SHA-256 of their bytes. Larger
 * payloads are split into 64 KiB chunks and the result is
 * SHA-256("memobuild-chunked-v1" || u64 size || chunk_digest_0 || ... || chunk_digest_n).
 * This is also the CAS key function for cached artifacts.
 */
Digest fingerprint_bytes(std::string_view data);

/** @brief Digest of a regular file's bytes, identical to fingerprint_bytes of its content. */
Result<Digest> fingerprint_file(const std::filesystem::path &path);

/**
 * @brief Canonical serialization of a manifest: the tag "memobuild-tree-v1", then for each
 * entry u64 path length, path bytes and the 32 digest bytes. Entries must already be sorted.
 */
std::string serialize_manifest(const std::vector<ManifestEntry> &entries);

/**
 * @brief Fingerprints a directory tree, skipping everything `ignore` matches.
 *
 * Top-level subtrees are hashed on `pool` when one is given. The digest is
 * fingerprint_bytes(serialize_manifest(entries)) with entries in byte-wise path order, so
 * worker scheduling never affects the result. Any unreadable entry fails the whole call.
 */
Result<TreeFingerprint> fingerprint_tree(const std::filesystem::path &root,
                                         const IgnoreRules &ignore,
                                         WorkerPool *pool = nullptr);

/** @brief Dispatches to fingerprint_file or fingerprint_tree depending on what `path` is. */
Result<Digest> fingerprint(const std::filesystem::path &path, const IgnoreRules &ignore, WorkerPool *pool = nullptr);

/** @brief Digest of an in-memory payload; ignore rules do not apply to bytes. */
inline Digest fingerprint(std::string_view bytes) {
    return fingerprint_bytes(bytes);
}

} // namespace memobuild
