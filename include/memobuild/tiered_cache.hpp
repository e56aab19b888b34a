#pragma once

#include "memobuild/artifact.hpp"
#include "memobuild/local_store.hpp"
#include "memobuild/memory_store.hpp"
#include "memobuild/remote_store.hpp"
#include "memobuild/session.hpp"
#include "memobuild/single_flight.hpp"
#include "memobuild/worker_pool.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace memobuild {

enum class RemotePolicy {
    Disabled,
    ReadOnly,  ///< Fetch from L3, never upload.
    ReadWrite, ///< Fetch and upload; remote errors degrade to misses.
    Required,  ///< Fetch and upload synchronously; remote errors fail the operation.
};

std::string_view to_string(RemotePolicy policy);
Result<RemotePolicy> parse_remote_policy(std::string_view text);

/**
 * @brief Three-level cache: MemoryStore (L1), LocalStore (L2), RemoteStore (L3).
 *
 * Lookups go L1, L2, L3 and stop at the first hit; L3 hits are written into L2 and L1. Writes go
 * to L1 and L2 synchronously and to L3 on a background upload queue (synchronously under
 * RemotePolicy::Required). Every blob crossing the L3 boundary is verified against its key.
 */
class TieredCache {
public:
    using Flights = SingleFlight<Digest, Result<Artifact>>;

    TieredCache(LocalStore local,
                std::unique_ptr<RemoteStore> remote = nullptr,
                RemotePolicy policy = RemotePolicy::Disabled);
    ~TieredCache();

    TieredCache(const TieredCache &) = delete;
    TieredCache &operator=(const TieredCache &) = delete;

    Result<bool> has(const Digest &digest, BuildSession &session);

    /** @return The artifact, CacheMiss when no tier has it, CASIntegrityFailure on corrupt data. */
    Result<Artifact> get(const Digest &digest, BuildSession &session);

    /** @brief Stores `artifact` under `digest` after checking that its bytes hash to `digest`. */
    Result<void> put(const Digest &digest, const Artifact &artifact, BuildSession &session);

    /** @return The action record for `node_digest`, or nullopt when no tier knows it. */
    Result<std::optional<ActionRecord>> lookup_action(const Digest &node_digest, BuildSession &session);
    Result<void> record_action(const ActionRecord &record, BuildSession &session);

    /** @brief Waits for queued L3 uploads. */
    void flush();

    /** @brief Registry that keeps one execution per node digest in flight. */
    Flights &flights() {
        return flights_;
    }

    MemoryStore &memory() {
        return memory_;
    }

    LocalStore &local() {
        return local_;
    }

    RemoteStore *remote() {
        return remote_.get();
    }

    RemotePolicy policy() const {
        return policy_;
    }

private:
    bool remote_readable() const;
    bool remote_writable() const;

    /** @brief Turns a remote failure into a miss unless it must surface. */
    Result<void> degrade(const Error &err, BuildSession &session, std::string_view what);
    Result<std::optional<Artifact>> fetch_remote(const Digest &digest, BuildSession &session);
    /** @brief Uploads a blob the remote does not already hold. */
    Result<void> upload_blob(const Artifact &artifact, BuildSession &session);
    Result<void> send_blob(const Artifact &artifact, BuildSession &session);
    Result<void> upload_action(const ActionRecord &record, BuildSession &session);

    MemoryStore memory_;
    LocalStore local_;
    std::unique_ptr<RemoteStore> remote_;
    RemotePolicy policy_;
    Flights flights_;
    std::unique_ptr<WorkerPool> uploads_;
};

} // namespace memobuild
