#ifndef GHCLIENT_CONFIG_HPP
#define GHCLIENT_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../retry/retry_policy.hpp"
#include "../utils/constants.hpp"

namespace ghclient::client {
    enum class CacheMode { NONE, MEMORY, DISK };

    struct EnvKeys {
        static constexpr const char* BASE_URL = "GHCLIENT_BASE_URL";
        static constexpr const char* TOKEN = "GHCLIENT_TOKEN";
        static constexpr const char* CACHE = "GHCLIENT_CACHE";
        static constexpr const char* CACHE_DIR = "GHCLIENT_CACHE_DIR";
        static constexpr const char* RETRIES = "GHCLIENT_RETRIES";
        static constexpr const char* LOG_LEVEL = "GHCLIENT_LOG_LEVEL";
    };

    const size_t DEFAULT_RETRY_COUNT = 3;

    struct ClientConfig {
        std::string base_url_ = constants::DEFAULT_BASE_URL;
        std::string user_agent_ = constants::DEFAULT_USER_AGENT;
        std::optional<std::string> auth_token_;
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
        retry::RetryPolicy retry_policy_ = retry::RetryPolicy::simple(DEFAULT_RETRY_COUNT);
        CacheMode cache_mode_ = CacheMode::MEMORY;
        std::string cache_dir_ = ".ghclient-cache";
        std::optional<std::string> log_level_;
        std::vector<std::string> extra_page_attributes_;

        using EnvLookup = std::function<std::optional<std::string>(const char*)>;

        // Process environment.
        static std::optional<std::string> getenv(const char* name);

        // Defaults overridden by GHCLIENT_* variables. Throws
        // std::invalid_argument for a malformed GHCLIENT_RETRIES or GHCLIENT_CACHE.
        static ClientConfig from_env(const EnvLookup& lookup = &ClientConfig::getenv);
    };

    // "none", "memory" or "disk", case-insensitive.
    CacheMode parse_cache_mode(std::string_view value);
}  // namespace ghclient::client

#endif
