#include "memobuild/session_record.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace memobuild {

namespace {
constexpr int session_record_version = 1;
}

Result<SessionRecord> SessionRecord::load(const fs::path &path) {
    SessionRecord record;
    std::error_code ec;
    if (!fs::exists(path, ec))
        return record;

    std::ifstream in(path);
    if (!in)
        return failf(ErrorKind::FilesystemError, "Failed to open session record {}", path.string());

    try {
        nlohmann::json doc = nlohmann::json::parse(in);
        int version = doc.value("version", 0);
        if (version != session_record_version) {
            return failf(ErrorKind::ParseError, "Session record {} has unsupported version {}", path.string(), version);
        }
        for (const auto &[key, value] : doc.at("digests").items()) {
            auto digest = Digest::from_hex(value.get<std::string>());
            if (!digest)
                return std::unexpected(digest.error());
            record.entries_.emplace(key, *digest);
        }
    } catch (const nlohmann::json::exception &err) {
        return failf(ErrorKind::ParseError, "Malformed session record {}: {}", path.string(), err.what());
    }
    return record;
}

Result<void> SessionRecord::save(const fs::path &path) const {
    nlohmann::json doc;
    doc["version"] = session_record_version;
    nlohmann::json digests = nlohmann::json::object();
    for (const auto &[key, digest] : entries_)
        digests[key] = digest.hex();
    doc["digests"] = std::move(digests);

    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
            return failf(ErrorKind::FilesystemError, "Failed to open {} for writing", tmp.string());
        out << doc.dump(2);
        if (!out)
            return failf(ErrorKind::FilesystemError, "Failed to write {}", tmp.string());
    }
    fs::rename(tmp, path, ec);
    if (ec)
        return failf(ErrorKind::FilesystemError, "Failed to replace {}: {}", path.string(), ec.message());
    return {};
}

std::optional<Digest> SessionRecord::lookup(const std::string &key) const {
    if (auto it = entries_.find(key); it != entries_.end())
        return it->second;
    return std::nullopt;
}

void SessionRecord::record(const std::string &key, const Digest &digest) {
    entries_[key] = digest;
}

} // namespace memobuild
