#include "memobuild/tiered_cache.hpp"

#include "memobuild/log.hpp"

namespace memobuild {

std::string_view to_string(RemotePolicy policy) {
    switch (policy) {
    case RemotePolicy::Disabled:
        return "disabled";
    case RemotePolicy::ReadOnly:
        return "read-only";
    case RemotePolicy::ReadWrite:
        return "read-write";
    case RemotePolicy::Required:
        return "required";
    }
    return "disabled";
}

Result<RemotePolicy> parse_remote_policy(std::string_view text) {
    if (text == "disabled" || text == "off")
        return RemotePolicy::Disabled;
    if (text == "read-only")
        return RemotePolicy::ReadOnly;
    if (text == "read-write")
        return RemotePolicy::ReadWrite;
    if (text == "required")
        return RemotePolicy::Required;
    return failf(ErrorKind::ParseError, "Unknown remote policy '{}' (expected disabled, read-only, read-write, required)",
                 text);
}

TieredCache::TieredCache(LocalStore local, std::unique_ptr<RemoteStore> remote, RemotePolicy policy)
    : local_(std::move(local)), remote_(std::move(remote)), policy_(remote_ ? policy : RemotePolicy::Disabled) {
    if (policy_ == RemotePolicy::ReadWrite)
        uploads_ = std::make_unique<WorkerPool>(2);
}

TieredCache::~TieredCache() {
    flush();
}

bool TieredCache::remote_readable() const {
    return remote_ && policy_ != RemotePolicy::Disabled;
}

bool TieredCache::remote_writable() const {
    return remote_ && (policy_ == RemotePolicy::ReadWrite || policy_ == RemotePolicy::Required);
}

void TieredCache::flush() {
    if (uploads_)
        uploads_->wait_idle();
}

Result<void> TieredCache::degrade(const Error &err, BuildSession &session, std::string_view what) {
    if (err.is(ErrorKind::CASIntegrityFailure)) {
        session.counters().integrity_failures++;
        log::error("integrity violation during {}: {}", what, err.message);
        return std::unexpected(err);
    }
    if (policy_ == RemotePolicy::Required)
        return std::unexpected(err);

    session.counters().remote_errors++;
    log::warn("remote cache {} failed, continuing without it: {}", what, err.message);
    return {};
}

Result<std::optional<Artifact>> TieredCache::fetch_remote(const Digest &digest, BuildSession &session) {
    auto fetched = remote_->get(digest);
    if (!fetched) {
        if (auto ok = degrade(fetched.error(), session, "fetch"); !ok)
            return std::unexpected(ok.error());
        return std::nullopt;
    }
    if (!*fetched)
        return std::nullopt;

    // verified by RemoteStore::get; promote downwards only
    const Artifact &artifact = **fetched;
    if (auto stored = local_.put(digest, artifact.data); !stored)
        log::warn("could not populate local cache with {}: {}", digest.short_hex(), stored.error().message);
    memory_.put(artifact);
    return fetched;
}

Result<bool> TieredCache::has(const Digest &digest, BuildSession &session) {
    if (memory_.has(digest) || local_.has(digest))
        return true;
    if (!remote_readable())
        return false;

    auto fetched = fetch_remote(digest, session);
    if (!fetched)
        return std::unexpected(fetched.error());
    return fetched->has_value();
}

Result<Artifact> TieredCache::get(const Digest &digest, BuildSession &session) {
    if (auto hit = memory_.get(digest)) {
        session.counters().l1_hits++;
        return std::move(*hit);
    }

    auto local = local_.get(digest);
    if (local) {
        session.counters().l2_hits++;
        memory_.put(*local);
        return local;
    }
    if (local.error().is(ErrorKind::CASIntegrityFailure)) {
        session.counters().integrity_failures++;
        return std::unexpected(local.error());
    }
    if (!local.error().is(ErrorKind::CacheMiss))
        return std::unexpected(local.error());

    if (remote_readable()) {
        auto fetched = fetch_remote(digest, session);
        if (!fetched)
            return std::unexpected(fetched.error());
        if (*fetched) {
            session.counters().l3_hits++;
            return std::move(**fetched);
        }
    }

    session.counters().misses++;
    return failf(ErrorKind::CacheMiss, "{} not cached", digest.short_hex());
}

Result<void> TieredCache::put(const Digest &digest, const Artifact &artifact, BuildSession &session) {
    if (auto ok = verify_content(digest, artifact.data); !ok) {
        session.counters().integrity_failures++;
        return ok;
    }

    Artifact keyed{digest, artifact.data};
    memory_.put(keyed);
    if (auto stored = local_.put(digest, keyed.data); !stored)
        return std::unexpected(stored.error());

    if (!remote_writable())
        return {};
    if (policy_ == RemotePolicy::Required)
        return upload_blob(keyed, session);

    uploads_->submit([this, keyed = std::move(keyed), &session] {
        if (auto ok = upload_blob(keyed, session); !ok)
            log::debug("upload of {} dropped: {}", keyed.digest.short_hex(), ok.error().message);
    });
    return {};
}

Result<void> TieredCache::upload_blob(const Artifact &artifact, BuildSession &session) {
    auto present = remote_->has(artifact.digest);
    if (!present) {
        session.counters().upload_failures++;
        return degrade(present.error(), session, "upload");
    }
    if (*present)
        return {};
    return send_blob(artifact, session);
}

Result<void> TieredCache::send_blob(const Artifact &artifact, BuildSession &session) {
    auto res = remote_->put(artifact);
    if (res) {
        session.counters().uploads++;
        return {};
    }
    session.counters().upload_failures++;
    return degrade(res.error(), session, "upload");
}

Result<std::optional<ActionRecord>> TieredCache::lookup_action(const Digest &node_digest, BuildSession &session) {
    if (auto hit = memory_.get_action(node_digest))
        return hit;

    auto local = local_.get_action(node_digest);
    if (local) {
        memory_.put_action(*local);
        return *local;
    }
    if (local.error().is(ErrorKind::CASIntegrityFailure)) {
        session.counters().integrity_failures++;
        return std::unexpected(local.error());
    }
    if (local.error().is(ErrorKind::ParseError)) {
        log::warn("ignoring unreadable action record for {}: {}", node_digest.short_hex(), local.error().message);
    } else if (!local.error().is(ErrorKind::CacheMiss)) {
        return std::unexpected(local.error());
    }

    if (!remote_readable())
        return std::nullopt;

    auto fetched = remote_->get_action(node_digest);
    if (!fetched) {
        if (auto ok = degrade(fetched.error(), session, "action lookup"); !ok)
            return std::unexpected(ok.error());
        return std::nullopt;
    }
    if (*fetched) {
        if (auto stored = local_.put_action(**fetched); !stored)
            log::warn("could not record action {} locally: {}", node_digest.short_hex(), stored.error().message);
        memory_.put_action(**fetched);
    }
    return fetched;
}

Result<void> TieredCache::record_action(const ActionRecord &record, BuildSession &session) {
    memory_.put_action(record);
    if (auto stored = local_.put_action(record); !stored)
        return stored;

    if (!remote_writable())
        return {};
    if (policy_ == RemotePolicy::Required)
        return upload_action(record, session);

    uploads_->submit([this, record, &session] {
        if (auto ok = upload_action(record, session); !ok)
            log::debug("upload of action {} dropped: {}", record.node_digest.short_hex(), ok.error().message);
    });
    return {};
}

Result<void> TieredCache::upload_action(const ActionRecord &record, BuildSession &session) {
    // the blob must be remote before a record points at it
    auto present = remote_->has(record.output_digest);
    if (!present) {
        session.counters().upload_failures++;
        return degrade(present.error(), session, "upload");
    }
    if (!*present) {
        auto blob = local_.get(record.output_digest);
        if (!blob)
            return std::unexpected(blob.error());
        if (auto ok = send_blob(*blob, session); !ok)
            return ok;
    }

    auto res = remote_->put_action(record);
    if (res)
        return {};
    session.counters().upload_failures++;
    return degrade(res.error(), session, "upload");
}

} // namespace memobuild
