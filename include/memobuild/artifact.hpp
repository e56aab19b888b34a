#pragma once

#include "memobuild/digest.hpp"
#include "memobuild/utility.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace memobuild {

/** @brief Output bytes of a node together with their content digest (the CAS key). */
struct Artifact {
    Digest digest;
    std::string data;

    /** @brief Builds an artifact, computing its digest with fingerprint_bytes. */
    static Artifact from_bytes(std::string data);

    size_t size() const {
        return data.size();
    }
};

/** @brief Bookkeeping for one stored blob, as reported by a store listing. */
struct CacheEntry {
    Digest digest;
    std::string artifact_location;
    uint64_t size = 0;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Maps a node digest to the content digest of the artifact it produced.
 *
 * Runner output never hashes to the node digest, so lookups by node digest go through one
 * of these and then fetch the blob by content digest.
 */
struct ActionRecord {
    Digest node_digest;
    Digest output_digest;
    uint64_t size = 0;
    int64_t created_at = 0; ///< Unix seconds.

    nlohmann::json to_json() const;
    std::string encode() const;
    static Result<ActionRecord> decode(std::string_view text);
};

/**
 * @brief Recomputes the digest of `data` and compares it with `key`.
 * @return CASIntegrityFailure naming both digests and the payload size on mismatch.
 */
Result<void> verify_content(const Digest &key, std::string_view data);

/** @brief Checks that a decoded action record really belongs to `key`. */
Result<void> verify_action(const Digest &key, const ActionRecord &record);

int64_t unix_now();

} // namespace memobuild
