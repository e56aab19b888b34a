#include "memobuild/local_store.hpp"

#include "memobuild/log.hpp"
#include "memobuild/mmap.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace memobuild {

namespace {

std::atomic<uint64_t> tmp_counter{0};

std::chrono::system_clock::time_point modified_at(const fs::path &path, std::error_code &ec) {
    auto ftime = fs::last_write_time(path, ec);
    if (ec)
        return {};
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ftime));
}

Result<std::string> read_file(const fs::path &path) {
    try {
        MappedFile file(path);
        return std::string(file.content());
    } catch (const std::runtime_error &err) {
        return fail(ErrorKind::StorageError, err.what());
    }
}

} // namespace

Result<LocalStore> LocalStore::open(const fs::path &root) {
    std::error_code ec;
    fs::create_directories(root / "blobs" / "sha256", ec);
    if (ec)
        return failf(ErrorKind::StorageError, "Failed to create cache directory {}: {}", root.string(), ec.message());
    fs::create_directories(root / "actions", ec);
    if (ec)
        return failf(ErrorKind::StorageError, "Failed to create cache directory {}: {}", root.string(), ec.message());
    return LocalStore(root);
}

fs::path LocalStore::blob_path(const Digest &digest) const {
    std::string hex = digest.hex();
    return root_ / "blobs" / "sha256" / hex.substr(0, 2) / hex.substr(2, 2) / hex;
}

fs::path LocalStore::action_path(const Digest &node_digest) const {
    std::string hex = node_digest.hex();
    return root_ / "actions" / hex.substr(0, 2) / (hex + ".json");
}

std::mutex &LocalStore::lock_for(const Digest &digest) const {
    return locks_[std::hash<Digest>{}(digest) % lock_stripes];
}

Result<void> LocalStore::write_atomic(const fs::path &dest, std::string_view data) const {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec)
        return failf(ErrorKind::StorageError, "Failed to create {}: {}", dest.parent_path().string(), ec.message());

    fs::path tmp = dest;
    tmp += std::format(".tmp.{}.{}", std::hash<std::thread::id>{}(std::this_thread::get_id()), tmp_counter++);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            return failf(ErrorKind::StorageError, "Failed to create {}", tmp.string());
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return failf(ErrorKind::StorageError, "Failed to write {}", tmp.string());
        }
    }

    fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return failf(ErrorKind::StorageError, "Failed to move {} into place: {}", dest.string(), ec.message());
    }
    return {};
}

bool LocalStore::has(const Digest &digest) const {
    std::error_code ec;
    return fs::is_regular_file(blob_path(digest), ec);
}

Result<Artifact> LocalStore::get(const Digest &digest) const {
    fs::path path = blob_path(digest);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return failf(ErrorKind::CacheMiss, "{} not in local cache", digest.short_hex());

    auto data = read_file(path);
    if (!data)
        return std::unexpected(data.error());

    if (auto ok = verify_content(digest, *data); !ok) {
        log::warn("removing corrupt cache entry {}", path.string());
        std::lock_guard lock(lock_for(digest));
        fs::remove(path, ec);
        return std::unexpected(ok.error());
    }
    return Artifact{digest, std::move(*data)};
}

Result<CacheEntry> LocalStore::put(const Digest &digest, std::string_view data) {
    if (auto ok = verify_content(digest, data); !ok)
        return std::unexpected(ok.error());

    fs::path path = blob_path(digest);
    std::lock_guard lock(lock_for(digest));

    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto existing = read_file(path);
        if (existing && verify_content(digest, *existing)) {
            auto created = modified_at(path, ec);
            return CacheEntry{digest, path.string(), data.size(), created};
        }
        log::warn("replacing corrupt cache entry {}", path.string());
    }

    if (auto ok = write_atomic(path, data); !ok)
        return std::unexpected(ok.error());
    return CacheEntry{digest, path.string(), data.size(), std::chrono::system_clock::now()};
}

bool LocalStore::has_action(const Digest &node_digest) const {
    std::error_code ec;
    return fs::is_regular_file(action_path(node_digest), ec);
}

Result<ActionRecord> LocalStore::get_action(const Digest &node_digest) const {
    fs::path path = action_path(node_digest);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return failf(ErrorKind::CacheMiss, "no action record for {}", node_digest.short_hex());

    auto text = read_file(path);
    if (!text)
        return std::unexpected(text.error());
    auto record = ActionRecord::decode(*text);
    if (!record)
        return std::unexpected(record.error());
    if (auto ok = verify_action(node_digest, *record); !ok)
        return std::unexpected(ok.error());
    return record;
}

Result<void> LocalStore::put_action(const ActionRecord &record) {
    std::lock_guard lock(lock_for(record.node_digest));
    return write_atomic(action_path(record.node_digest), record.encode());
}

Result<std::vector<CacheEntry>> LocalStore::entries() const {
    std::vector<CacheEntry> result;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_ / "blobs" / "sha256", ec);
    if (ec)
        return failf(ErrorKind::StorageError, "Failed to list {}: {}", root_.string(), ec.message());

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        if (!it->is_regular_file(ec))
            continue;
        auto digest = Digest::from_hex(it->path().filename().string());
        if (!digest)
            continue; // stray temporary files
        CacheEntry entry;
        entry.digest = *digest;
        entry.artifact_location = it->path().string();
        entry.size = it->file_size(ec);
        entry.created_at = modified_at(it->path(), ec);
        result.push_back(std::move(entry));
    }
    if (ec)
        return failf(ErrorKind::StorageError, "Failed to list {}: {}", root_.string(), ec.message());

    std::sort(result.begin(), result.end(), [](const CacheEntry &a, const CacheEntry &b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.digest < b.digest);
    });
    return result;
}

Result<GcStats> LocalStore::gc_older_than(std::chrono::seconds max_age) {
    auto cutoff = std::chrono::system_clock::now() - max_age;
    GcStats stats;

    auto listed = entries();
    if (!listed)
        return std::unexpected(listed.error());
    for (const auto &entry : *listed) {
        if (entry.created_at >= cutoff)
            continue;
        std::lock_guard lock(lock_for(entry.digest));
        std::error_code ec;
        if (fs::remove(entry.artifact_location, ec)) {
            ++stats.removed;
            stats.bytes_freed += entry.size;
        }
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root_ / "actions", ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        if (modified_at(it->path(), ec) < cutoff) {
            std::error_code rm_ec;
            fs::remove(it->path(), rm_ec);
        }
    }
    if (ec)
        return failf(ErrorKind::StorageError, "Failed to sweep action records: {}", ec.message());

    log::debug("gc: removed {} blobs ({} bytes) older than {}s", stats.removed, stats.bytes_freed, max_age.count());
    return stats;
}

Result<GcStats> LocalStore::gc_to_size(uint64_t max_bytes) {
    auto listed = entries();
    if (!listed)
        return std::unexpected(listed.error());

    uint64_t total = 0;
    for (const auto &entry : *listed)
        total += entry.size;

    GcStats stats;
    for (const auto &entry : *listed) {
        if (total <= max_bytes)
            break;
        std::lock_guard lock(lock_for(entry.digest));
        std::error_code ec;
        if (fs::remove(entry.artifact_location, ec)) {
            ++stats.removed;
            stats.bytes_freed += entry.size;
            total -= entry.size;
        }
    }
    log::debug("gc: evicted {} blobs ({} bytes), {} bytes remain", stats.removed, stats.bytes_freed, total);
    return stats;
}

} // namespace memobuild
