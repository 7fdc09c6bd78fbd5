#ifndef GHCLIENT_CACHE_STORAGE_HPP
#define GHCLIENT_CACHE_STORAGE_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../model/headers.hpp"
#include "cache_key.hpp"

namespace ghclient::cache {
    // Snapshot of a 200 response that carried a validator.
    struct CachedResponse {
        std::string body_;
        model::HeaderMap headers_;
    };

    // Accumulates a response body. Nothing is visible in the storage until
    // commit(); a writer destroyed before commit() leaves the storage untouched.
    class ICacheWriter {
       public:
        ICacheWriter() = default;
        virtual ~ICacheWriter() = default;
        ICacheWriter(const ICacheWriter &) = delete;
        ICacheWriter &operator=(const ICacheWriter &) = delete;
        ICacheWriter(ICacheWriter &&) = delete;
        ICacheWriter &operator=(ICacheWriter &&) = delete;

        virtual void write_body(std::string_view data) = 0;
        virtual void commit() = 0;
    };

    // Storage backend for HttpCacheLayer. Implementations must be safe to call
    // concurrently from several threads.
    class ICacheStorage {
       public:
        ICacheStorage() = default;
        virtual ~ICacheStorage() = default;
        ICacheStorage(const ICacheStorage &) = delete;
        ICacheStorage &operator=(const ICacheStorage &) = delete;
        ICacheStorage(ICacheStorage &&) = delete;
        ICacheStorage &operator=(ICacheStorage &&) = delete;

        // Stored validator for `uri`, if any.
        [[nodiscard]] virtual std::optional<CacheKey> try_hit(const std::string &uri) const = 0;

        // Stored response for `uri`. Expected to succeed whenever try_hit() did,
        // unless the entry was evicted in between.
        [[nodiscard]] virtual std::optional<CachedResponse> load(const std::string &uri) const = 0;

        [[nodiscard]] virtual std::unique_ptr<ICacheWriter> writer(const std::string &uri, CacheKey key, model::HeaderMap headers) = 0;
    };
}  // namespace ghclient::cache

#endif
