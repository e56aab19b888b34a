#pragma once

#include "memobuild/remote_store.hpp"
#include "memobuild/tiered_cache.hpp"
#include "memobuild/utility.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace memobuild {

struct CacheConfig {
    std::filesystem::path dir;
    std::string remote_url;
    std::optional<RemotePolicy> remote_policy;
    RetryPolicy retry;
};

/**
 * @brief Fills fields the command line left empty from the environment.
 *
 * MEMOBUILD_CACHE_DIR (else $HOME/.memobuild/cache, else ./.memobuild/cache),
 * MEMOBUILD_REMOTE_URL and MEMOBUILD_REMOTE_POLICY. A configured URL without a policy means
 * read-write.
 */
Result<void> apply_environment(CacheConfig &config);

/** @brief Opens the local store and, if a remote URL is set, a curl-backed remote tier. */
Result<std::unique_ptr<TieredCache>> open_cache(const CacheConfig &config);

} // namespace memobuild
