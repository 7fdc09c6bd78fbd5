#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

#include "../utils/string_utils.hpp"

namespace ghclient::client {
    std::optional<std::string> ClientConfig::getenv(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    CacheMode parse_cache_mode(std::string_view value) {
        const std::string mode = string_utils::to_lower(string_utils::trim(std::string(value)));
        if (mode == "none") {
            return CacheMode::NONE;
        }
        if (mode == "memory") {
            return CacheMode::MEMORY;
        }
        if (mode == "disk") {
            return CacheMode::DISK;
        }
        throw std::invalid_argument("unknown cache mode: " + std::string(value));
    }

    ClientConfig ClientConfig::from_env(const EnvLookup& lookup) {
        ClientConfig config;

        if (auto base_url = lookup(EnvKeys::BASE_URL); base_url && !base_url->empty()) {
            config.base_url_ = *base_url;
        }
        if (auto token = lookup(EnvKeys::TOKEN); token && !token->empty()) {
            config.auth_token_ = *token;
        }
        if (auto cache = lookup(EnvKeys::CACHE)) {
            config.cache_mode_ = parse_cache_mode(*cache);
        }
        if (auto cache_dir = lookup(EnvKeys::CACHE_DIR); cache_dir && !cache_dir->empty()) {
            config.cache_dir_ = *cache_dir;
        }
        if (auto retries = lookup(EnvKeys::RETRIES)) {
            auto n = string_utils::parse_long(*retries);
            if (!n || *n < 0) {
                throw std::invalid_argument(std::string(EnvKeys::RETRIES) + " must be a non-negative integer, got: " + *retries);
            }
            config.retry_policy_ = *n == 0 ? retry::RetryPolicy::none() : retry::RetryPolicy::simple(static_cast<size_t>(*n));
        }
        if (auto level = lookup(EnvKeys::LOG_LEVEL); level && !level->empty()) {
            config.log_level_ = *level;
        }
        return config;
    }
}  // namespace ghclient::client
