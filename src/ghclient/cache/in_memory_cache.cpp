#include "in_memory_cache.hpp"

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace ghclient::cache {
    class InMemoryCache::Writer : public ICacheWriter {
       public:
        Writer(std::shared_ptr<Shards> shards, std::string uri, CacheKey key, model::HeaderMap headers)
            : shards_(std::move(shards)), uri_(std::move(uri)), key_(std::move(key)) {
            response_.headers_ = std::move(headers);
        }

        void write_body(std::string_view data) override { response_.body_.append(data); }

        void commit() override {
            if (committed_) {
                return;
            }
            committed_ = true;

            auto snapshot = std::make_shared<const CachedResponse>(std::move(response_));
            Shard &shard = shard_for(*shards_, uri_);
            std::unique_lock<std::shared_mutex> lock(shard.mutex_);
            shard.entries_.insert_or_assign(uri_, Entry{.key_ = key_, .response_ = std::move(snapshot)});
        }

       private:
        std::shared_ptr<Shards> shards_;
        std::string uri_;
        CacheKey key_;
        CachedResponse response_;
        bool committed_ = false;
    };

    InMemoryCache::InMemoryCache() : shards_(std::make_shared<Shards>()) {}

    InMemoryCache::Shard &InMemoryCache::shard_for(Shards &shards, const std::string &uri) {
        return shards[std::hash<std::string>{}(uri) % IN_MEMORY_SHARD_COUNT];
    }

    std::optional<CacheKey> InMemoryCache::try_hit(const std::string &uri) const {
        const Shard &shard = shard_for(*shards_, uri);
        std::shared_lock<std::shared_mutex> lock(shard.mutex_);
        auto it = shard.entries_.find(uri);
        if (it == shard.entries_.end()) {
            return std::nullopt;
        }
        return it->second.key_;
    }

    std::optional<CachedResponse> InMemoryCache::load(const std::string &uri) const {
        std::shared_ptr<const CachedResponse> snapshot;
        {
            const Shard &shard = shard_for(*shards_, uri);
            std::shared_lock<std::shared_mutex> lock(shard.mutex_);
            auto it = shard.entries_.find(uri);
            if (it == shard.entries_.end()) {
                return std::nullopt;
            }
            snapshot = it->second.response_;
        }
        // Copy outside the lock.
        return *snapshot;
    }

    std::unique_ptr<ICacheWriter> InMemoryCache::writer(const std::string &uri, CacheKey key, model::HeaderMap headers) {
        return std::make_unique<Writer>(shards_, uri, std::move(key), std::move(headers));
    }

    size_t InMemoryCache::size() const {
        size_t total = 0;
        for (const Shard &shard : *shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex_);
            total += shard.entries_.size();
        }
        return total;
    }
}  // namespace ghclient::cache
