#include "cache_key.hpp"

#include <optional>
#include <string>

namespace ghclient::cache {
    std::optional<CacheKey> CacheKey::extract_from_headers(const model::HeaderMap& headers) {
        if (auto etag = headers.get(model::HeaderKeys::ETAG); etag && !etag->empty()) {
            return CacheKey{.kind_ = Kind::ETAG, .value_ = std::move(*etag)};
        }
        if (auto last_modified = headers.get(model::HeaderKeys::LAST_MODIFIED); last_modified && !last_modified->empty()) {
            return CacheKey{.kind_ = Kind::LAST_MODIFIED, .value_ = std::move(*last_modified)};
        }
        return std::nullopt;
    }

    const char* CacheKey::conditional_header() const {
        return kind_ == Kind::ETAG ? model::HeaderKeys::IF_NONE_MATCH : model::HeaderKeys::IF_MODIFIED_SINCE;
    }
}  // namespace ghclient::cache
