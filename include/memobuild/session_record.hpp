#pragma once

#include "memobuild/digest.hpp"
#include "memobuild/utility.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace memobuild {

/**
 * @brief Digests of the previous build session, keyed by logical node identity.
 *
 * Stored as a small versioned JSON document. A missing file is an empty record; a file with
 * another version is rejected rather than guessed at.
 */
class SessionRecord {
public:
    static Result<SessionRecord> load(const std::filesystem::path &path);

    /** @brief Writes to a temporary sibling and renames it into place. */
    Result<void> save(const std::filesystem::path &path) const;

    std::optional<Digest> lookup(const std::string &key) const;
    void record(const std::string &key, const Digest &digest);

    size_t size() const {
        return entries_.size();
    }

private:
    std::map<std::string, Digest> entries_;
};

} // namespace memobuild
