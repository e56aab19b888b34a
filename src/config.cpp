#include "memobuild/config.hpp"

#include "memobuild/log.hpp"

#include <cstdlib>

namespace memobuild {

namespace {

std::optional<std::string> env_var(const char *name) {
    const char *value = std::getenv(name);
    if (!value || !*value)
        return std::nullopt;
    return std::string(value);
}

} // namespace

Result<void> apply_environment(CacheConfig &config) {
    if (config.dir.empty()) {
        if (auto dir = env_var("MEMOBUILD_CACHE_DIR"))
            config.dir = *dir;
        else if (auto home = env_var("HOME"))
            config.dir = std::filesystem::path(*home) / ".memobuild" / "cache";
        else
            config.dir = std::filesystem::path(".memobuild") / "cache";
    }

    if (config.remote_url.empty()) {
        if (auto url = env_var("MEMOBUILD_REMOTE_URL"))
            config.remote_url = *url;
    }

    if (!config.remote_policy) {
        if (auto policy = env_var("MEMOBUILD_REMOTE_POLICY")) {
            auto parsed = parse_remote_policy(*policy);
            if (!parsed)
                return std::unexpected(parsed.error());
            config.remote_policy = *parsed;
        }
    }
    if (!config.remote_policy)
        config.remote_policy = config.remote_url.empty() ? RemotePolicy::Disabled : RemotePolicy::ReadWrite;
    return {};
}

Result<std::unique_ptr<TieredCache>> open_cache(const CacheConfig &config) {
    auto local = LocalStore::open(config.dir);
    if (!local)
        return std::unexpected(local.error());

    RemotePolicy policy = config.remote_policy.value_or(RemotePolicy::Disabled);
    std::unique_ptr<RemoteStore> remote;
    if (!config.remote_url.empty() && policy != RemotePolicy::Disabled) {
        remote = std::make_unique<RemoteStore>(std::make_shared<CurlTransport>(config.remote_url), config.retry);
        log::debug("remote cache {} ({})", config.remote_url, to_string(policy));
    } else if (policy == RemotePolicy::Required) {
        return fail(ErrorKind::InvalidState, "Remote policy 'required' needs a remote URL");
    }

    return std::make_unique<TieredCache>(std::move(*local), std::move(remote), policy);
}

} // namespace memobuild
