#ifndef GHCLIENT_IN_MEMORY_CACHE_HPP
#define GHCLIENT_IN_MEMORY_CACHE_HPP

#include <array>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "cache_storage.hpp"

namespace ghclient::cache {
    const size_t IN_MEMORY_SHARD_COUNT = 16;

    // Process-local storage. Entries are spread over independently locked
    // shards so lookups and commits for different URIs rarely contend.
    class InMemoryCache : public ICacheStorage {
       public:
        InMemoryCache();

        [[nodiscard]] std::optional<CacheKey> try_hit(const std::string &uri) const override;
        [[nodiscard]] std::optional<CachedResponse> load(const std::string &uri) const override;
        [[nodiscard]] std::unique_ptr<ICacheWriter> writer(const std::string &uri, CacheKey key, model::HeaderMap headers) override;

        [[nodiscard]] size_t size() const;

       private:
        struct Entry {
            CacheKey key_;
            std::shared_ptr<const CachedResponse> response_;
        };

        struct Shard {
            mutable std::shared_mutex mutex_;
            std::unordered_map<std::string, Entry> entries_;
        };

        using Shards = std::array<Shard, IN_MEMORY_SHARD_COUNT>;

        class Writer;

        [[nodiscard]] static Shard &shard_for(Shards &shards, const std::string &uri);

        std::shared_ptr<Shards> shards_;
    };
}  // namespace ghclient::cache

#endif
