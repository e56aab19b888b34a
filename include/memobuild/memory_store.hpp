#pragma once

#include "memobuild/artifact.hpp"
#include "memobuild/digest.hpp"

#include <array>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace memobuild {

/**
 * @brief L1 tier: process-local map of blobs and action records.
 *
 * Split into shards, each behind its own reader/writer lock, so lookups of distinct digests
 * do not contend.
 */
class MemoryStore {
public:
    static constexpr size_t shard_count = 16;

    bool has(const Digest &digest) const;
    std::optional<Artifact> get(const Digest &digest) const;
    /** @brief Stores an already verified artifact; an existing entry is kept as is. */
    void put(const Artifact &artifact);

    std::optional<ActionRecord> get_action(const Digest &node_digest) const;
    void put_action(const ActionRecord &record);

    size_t size() const;
    size_t bytes() const;
    void clear();

private:
    struct Shard {
        mutable std::shared_mutex mtx;
        std::unordered_map<Digest, std::string> blobs;
        std::unordered_map<Digest, ActionRecord> actions;
    };

    Shard &shard_for(const Digest &digest) const {
        return shards_[digest.bytes[0] % shard_count];
    }

    mutable std::array<Shard, shard_count> shards_;
};

} // namespace memobuild
