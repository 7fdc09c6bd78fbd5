#ifndef GHCLIENT_NO_CACHE_HPP
#define GHCLIENT_NO_CACHE_HPP

#include <memory>
#include <optional>
#include <string>

#include "cache_storage.hpp"

namespace ghclient::cache {
    // Never hits, discards every write.
    class NoCache : public ICacheStorage {
       public:
        [[nodiscard]] std::optional<CacheKey> try_hit(const std::string & /*uri*/) const override { return std::nullopt; }
        [[nodiscard]] std::optional<CachedResponse> load(const std::string & /*uri*/) const override { return std::nullopt; }
        [[nodiscard]] std::unique_ptr<ICacheWriter> writer(const std::string & /*uri*/, CacheKey /*key*/, model::HeaderMap /*headers*/) override {
            return std::make_unique<NullWriter>();
        }

       private:
        class NullWriter : public ICacheWriter {
           public:
            void write_body(std::string_view /*data*/) override {}
            void commit() override {}
        };
    };
}  // namespace ghclient::cache

#endif
