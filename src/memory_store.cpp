#include "memobuild/memory_store.hpp"

#include <mutex>

namespace memobuild {

bool MemoryStore::has(const Digest &digest) const {
    Shard &shard = shard_for(digest);
    std::shared_lock lock(shard.mtx);
    return shard.blobs.contains(digest);
}

std::optional<Artifact> MemoryStore::get(const Digest &digest) const {
    Shard &shard = shard_for(digest);
    std::shared_lock lock(shard.mtx);
    auto it = shard.blobs.find(digest);
    if (it == shard.blobs.end())
        return std::nullopt;
    return Artifact{digest, it->second};
}

void MemoryStore::put(const Artifact &artifact) {
    Shard &shard = shard_for(artifact.digest);
    std::unique_lock lock(shard.mtx);
    shard.blobs.try_emplace(artifact.digest, artifact.data);
}

std::optional<ActionRecord> MemoryStore::get_action(const Digest &node_digest) const {
    Shard &shard = shard_for(node_digest);
    std::shared_lock lock(shard.mtx);
    auto it = shard.actions.find(node_digest);
    if (it == shard.actions.end())
        return std::nullopt;
    return it->second;
}

void MemoryStore::put_action(const ActionRecord &record) {
    Shard &shard = shard_for(record.node_digest);
    std::unique_lock lock(shard.mtx);
    shard.actions.insert_or_assign(record.node_digest, record);
}

size_t MemoryStore::size() const {
    size_t n = 0;
    for (auto &shard : shards_) {
        std::shared_lock lock(shard.mtx);
        n += shard.blobs.size();
    }
    return n;
}

size_t MemoryStore::bytes() const {
    size_t n = 0;
    for (auto &shard : shards_) {
        std::shared_lock lock(shard.mtx);
        for (const auto &[_, data] : shard.blobs)
            n += data.size();
    }
    return n;
}

void MemoryStore::clear() {
    for (auto &shard : shards_) {
        std::unique_lock lock(shard.mtx);
        shard.blobs.clear();
        shard.actions.clear();
    }
}

} // namespace memobuild
