#ifndef GHCLIENT_CACHE_LAYER_HPP
#define GHCLIENT_CACHE_LAYER_HPP

#include <memory>
#include <string>

#include "../client/interface.hpp"
#include "../model/model.hpp"
#include "cache_storage.hpp"

namespace ghclient::cache {
    // Conditional caching middleware.
    //
    // Only GET requests without a caller-set If-None-Match / If-Modified-Since
    // take part; everything else is forwarded untouched.
    //
    // Requests for a URI the storage holds an entry for are sent with
    // If-None-Match / If-Modified-Since. A 304 reply is rewritten into a 200
    // carrying the stored body and the stored Content-Type, Content-Length and
    // Link headers. A 200 reply with a validator is passed through a
    // WriteToCacheBody so the entry is (re)written as the caller reads it.
    //
    // A 304 for which the storage no longer has a body triggers a single
    // unconditional re-fetch; a second 304 raises error::CacheInconsistencyError.
    class HttpCacheLayer : public client::IMiddleware {
       public:
        explicit HttpCacheLayer(std::shared_ptr<ICacheStorage> storage);

        model::Response handle(model::Request req, client::IHttpClient &next) override;

        [[nodiscard]] const std::shared_ptr<ICacheStorage> &storage() const { return storage_; }

       private:
        static bool is_cacheable_request(const model::Request &req);
        static void restore_from(const CachedResponse &cached, model::Response &resp);
        model::Response store_if_cacheable(const std::string &uri, model::Response resp);

        std::shared_ptr<ICacheStorage> storage_;
    };
}  // namespace ghclient::cache

#endif
