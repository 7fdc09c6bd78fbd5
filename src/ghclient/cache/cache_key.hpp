#ifndef GHCLIENT_CACHE_KEY_HPP
#define GHCLIENT_CACHE_KEY_HPP

#include <optional>
#include <string>

#include "../model/headers.hpp"

namespace ghclient::cache {
    // Validator returned by the server for a cacheable response.
    struct CacheKey {
        enum class Kind { ETAG, LAST_MODIFIED };

        Kind kind_ = Kind::ETAG;
        std::string value_;

        // ETag takes precedence over Last-Modified.
        static std::optional<CacheKey> extract_from_headers(const model::HeaderMap& headers);

        // If-None-Match for an ETag, If-Modified-Since for a Last-Modified date.
        [[nodiscard]] const char* conditional_header() const;

        bool operator==(const CacheKey& other) const = default;
    };
}  // namespace ghclient::cache

#endif
