#include "memobuild/fingerprint.hpp"

#include "memobuild/mmap.hpp"
#include "memobuild/worker_pool.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace memobuild {

namespace {

std::string join_rel(const std::string &parent, const std::string &name) {
    return parent.empty() ? name : parent + "/" + name;
}

Result<ManifestEntry> hash_entry(const fs::directory_entry &entry, const std::string &rel) {
    std::error_code ec;
    if (entry.is_symlink(ec)) {
        // links are recorded by target, never followed
        fs::path target = fs::read_symlink(entry.path(), ec);
        if (ec)
            return failf(ErrorKind::FilesystemError, "Cannot read link {}: {}", entry.path().string(), ec.message());
        std::string payload = "symlink:" + target.generic_string();
        return ManifestEntry{rel, fingerprint_bytes(payload), payload.size()};
    }

    auto digest = fingerprint_file(entry.path());
    if (!digest)
        return std::unexpected(digest.error());
    uint64_t size = entry.file_size(ec);
    if (ec)
        return failf(ErrorKind::FilesystemError, "Cannot stat {}: {}", entry.path().string(), ec.message());
    return ManifestEntry{rel, *digest, size};
}

// Sequential walk of one subtree. `rel` is the subtree's path relative to the root.
Result<void> walk(const fs::path &dir, const std::string &rel, const IgnoreRules &ignore,
                  std::vector<ManifestEntry> &out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry &entry = *it;
        std::string child_rel = join_rel(rel, entry.path().filename().string());
        bool is_link = entry.is_symlink(ec);
        bool is_dir = !is_link && entry.is_directory(ec);
        if (ignore.is_ignored(child_rel, is_dir))
            continue;

        if (is_dir) {
            if (auto res = walk(entry.path(), child_rel, ignore, out); !res)
                return res;
        } else if (is_link || entry.is_regular_file(ec)) {
            auto hashed = hash_entry(entry, child_rel);
            if (!hashed)
                return std::unexpected(hashed.error());
            out.push_back(std::move(*hashed));
        }
        // sockets, fifos and devices carry no content
    }
    if (ec)
        return failf(ErrorKind::FilesystemError, "Cannot read directory {}: {}", dir.string(), ec.message());
    return {};
}

} // namespace

Digest fingerprint_bytes(std::string_view data) {
    if (data.size() <= fingerprint_chunk_size) {
        return sha256(data);
    }
    Hasher h;
    h.update("memobuild-chunked-v1");
    h.update_u64(data.size());
    for (size_t off = 0; off < data.size(); off += fingerprint_chunk_size) {
        h.update_digest(sha256(data.substr(off, fingerprint_chunk_size)));
    }
    return h.finish();
}

Result<Digest> fingerprint_file(const fs::path &path) {
    try {
        MappedFile file(path);
        if (file.size() <= fingerprint_chunk_size)
            return sha256(file.content());

        Hasher h;
        h.update("memobuild-chunked-v1");
        h.update_u64(file.size());
        file.for_each_chunk(fingerprint_chunk_size, [&h](std::string_view chunk) { h.update_digest(sha256(chunk)); });
        return h.finish();
    } catch (const std::exception &err) {
        return fail(ErrorKind::FilesystemError, err.what());
    }
}

std::string serialize_manifest(const std::vector<ManifestEntry> &entries) {
    std::string out = "memobuild-tree-v1";
    for (const auto &e : entries) {
        uint64_t len = e.path.size();
        for (int i = 0; i < 8; ++i)
            out.push_back(static_cast<char>(len >> (8 * i)));
        out.append(e.path);
        out.append(reinterpret_cast<const char *>(e.digest.bytes.data()), e.digest.bytes.size());
    }
    return out;
}

Result<TreeFingerprint> fingerprint_tree(const fs::path &root, const IgnoreRules &ignore, WorkerPool *pool) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return failf(ErrorKind::FilesystemError, "Not a directory: {}", root.string());
    }

    // One slot per top-level entry; slots are filled independently and merged afterwards.
    std::vector<std::future<Result<std::vector<ManifestEntry>>>> pending;
    fs::directory_iterator it(root, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry &entry = *it;
        std::string rel = entry.path().filename().string();
        bool is_link = entry.is_symlink(ec);
        bool is_dir = !is_link && entry.is_directory(ec);
        if (ignore.is_ignored(rel, is_dir))
            continue;
        if (!is_dir && !is_link && !entry.is_regular_file(ec))
            continue;

        auto job = [entry, rel, is_dir, &ignore]() -> Result<std::vector<ManifestEntry>> {
            std::vector<ManifestEntry> out;
            if (is_dir) {
                if (auto res = walk(entry.path(), rel, ignore, out); !res)
                    return std::unexpected(res.error());
            } else {
                auto hashed = hash_entry(entry, rel);
                if (!hashed)
                    return std::unexpected(hashed.error());
                out.push_back(std::move(*hashed));
            }
            return out;
        };

        if (pool && is_dir) {
            pending.push_back(pool->submit(std::move(job)));
        } else {
            std::promise<Result<std::vector<ManifestEntry>>> ready;
            ready.set_value(job());
            pending.push_back(ready.get_future());
        }
    }

    TreeFingerprint tree;
    std::optional<Error> first_error;
    if (ec)
        first_error = Error{ErrorKind::FilesystemError, std::format("Cannot read directory {}: {}", root.string(), ec.message())};
    // every future is drained before returning so no task outlives `ignore`
    for (auto &f : pending) {
        auto part = f.get();
        if (!part) {
            if (!first_error)
                first_error = part.error();
            continue;
        }
        std::move(part->begin(), part->end(), std::back_inserter(tree.entries));
    }
    if (first_error)
        return std::unexpected(*first_error);

    std::sort(tree.entries.begin(), tree.entries.end(),
              [](const ManifestEntry &a, const ManifestEntry &b) { return a.path < b.path; });
    tree.digest = fingerprint_bytes(serialize_manifest(tree.entries));
    return tree;
}

Result<Digest> fingerprint(const fs::path &path, const IgnoreRules &ignore, WorkerPool *pool) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec)
        return failf(ErrorKind::FilesystemError, "Cannot access {}: {}", path.string(), ec.message());

    if (fs::is_directory(status)) {
        auto tree = fingerprint_tree(path, ignore, pool);
        if (!tree)
            return std::unexpected(tree.error());
        return tree->digest;
    }
    if (fs::is_regular_file(status)) {
        return fingerprint_file(path);
    }
    return failf(ErrorKind::FilesystemError, "Unsupported file type: {}", path.string());
}

} // namespace memobuild
