#pragma once

#include "memobuild/artifact.hpp"
#include "memobuild/digest.hpp"
#include "memobuild/utility.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace memobuild {

struct GcStats {
    size_t removed = 0;
    uint64_t bytes_freed = 0;
};

/**
 * @brief L2 tier: content-addressed blobs and action records on local disk.
 *
 * Layout under the root:
 *   blobs/sha256/ab/cd/<hex>   artifact bytes
 *   actions/ab/<hex>.json      action records
 *
 * Writes land in a temporary file that is renamed into place, so readers never observe a
 * partial blob. Concurrent writers of one key are serialized through a striped lock table.
 */
class LocalStore {
public:
    /** @brief Opens (creating if needed) a store rooted at `root`. */
    static Result<LocalStore> open(const std::filesystem::path &root);

    LocalStore(LocalStore &&other) noexcept : root_(std::move(other.root_)) {
    }

    const std::filesystem::path &root() const {
        return root_;
    }

    std::filesystem::path blob_path(const Digest &digest) const;
    std::filesystem::path action_path(const Digest &node_digest) const;

    bool has(const Digest &digest) const;

    /**
     * @brief Reads and re-verifies a blob.
     * @return CacheMiss when absent; CASIntegrityFailure (after deleting the file) when the
     *         bytes no longer hash to `digest`.
     */
    Result<Artifact> get(const Digest &digest) const;

    /**
     * @brief Verifies and stores `data` under `digest`.
     *
     * Storing a key that is already present with intact content is a no-op. A present but
     * corrupt blob is replaced.
     */
    Result<CacheEntry> put(const Digest &digest, std::string_view data);

    bool has_action(const Digest &node_digest) const;
    Result<ActionRecord> get_action(const Digest &node_digest) const;
    Result<void> put_action(const ActionRecord &record);

    /** @brief Lists all blobs, oldest first. */
    Result<std::vector<CacheEntry>> entries() const;

    /** @brief Removes blobs and action records last written more than `max_age` ago. */
    Result<GcStats> gc_older_than(std::chrono::seconds max_age);

    /** @brief Evicts the oldest blobs until the total blob size is at most `max_bytes`. */
    Result<GcStats> gc_to_size(uint64_t max_bytes);

private:
    explicit LocalStore(std::filesystem::path root) : root_(std::move(root)) {
    }

    static constexpr size_t lock_stripes = 64;

    std::mutex &lock_for(const Digest &digest) const;
    Result<void> write_atomic(const std::filesystem::path &dest, std::string_view data) const;

    std::filesystem::path root_;
    mutable std::array<std::mutex, lock_stripes> locks_;
};

} // namespace memobuild
