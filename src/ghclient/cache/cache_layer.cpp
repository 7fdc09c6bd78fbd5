#include "cache_layer.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "../error/errors.hpp"
#include "../logging/logger.hpp"
#include "write_through_body.hpp"

namespace ghclient::cache {
    // Headers a 304 may omit that decoding and pagination still need.
    static constexpr const char *RESTORED_HEADERS[] = {
        model::HeaderKeys::CONTENT_TYPE,
        model::HeaderKeys::CONTENT_LENGTH,
        model::HeaderKeys::LINK,
    };

    HttpCacheLayer::HttpCacheLayer(std::shared_ptr<ICacheStorage> storage) : storage_(std::move(storage)) {
        if (storage_ == nullptr) {
            throw std::invalid_argument("HttpCacheLayer requires a storage backend");
        }
    }

    bool HttpCacheLayer::is_cacheable_request(const model::Request &req) {
        return req.method_ == "GET" && !req.headers_.contains(model::HeaderKeys::IF_NONE_MATCH) &&
               !req.headers_.contains(model::HeaderKeys::IF_MODIFIED_SINCE);
    }

    model::Response HttpCacheLayer::handle(model::Request req, client::IHttpClient &next) {
        // Other methods and caller-driven revalidation bypass the cache entirely.
        if (!is_cacheable_request(req)) {
            return next.send(std::move(req));
        }

        const std::string uri = req.url_;

        std::optional<model::Request> unconditional;
        bool conditional = false;
        if (auto key = storage_->try_hit(uri)) {
            unconditional = model::clone_request(req);
            req.headers_.set(key->conditional_header(), key->value_);
            conditional = true;
            logging::logger()->debug("cache: {} has a stored validator, sending {}", uri, key->conditional_header());
        }

        model::Response resp = next.send(std::move(req));

        if (resp.status_ != static_cast<long>(model::HttpStatusCode::NOT_MODIFIED)) {
            return store_if_cacheable(uri, std::move(resp));
        }

        // A 304 for a validator this layer did not send belongs to the caller.
        if (!conditional) {
            return resp;
        }

        if (auto cached = storage_->load(uri)) {
            logging::logger()->debug("cache: hit for {}", uri);
            restore_from(*cached, resp);
            return resp;
        }

        logging::logger()->warn("cache: 304 for {} but no stored response, re-fetching without validator", uri);
        if (!unconditional) {
            throw error::CacheInconsistencyError(uri);
        }
        resp = next.send(std::move(*unconditional));
        if (resp.status_ == static_cast<long>(model::HttpStatusCode::NOT_MODIFIED)) {
            throw error::CacheInconsistencyError(uri);
        }
        return store_if_cacheable(uri, std::move(resp));
    }

    void HttpCacheLayer::restore_from(const CachedResponse &cached, model::Response &resp) {
        for (const char *name : RESTORED_HEADERS) {
            auto values = cached.headers_.get_all(name);
            if (values.empty()) {
                continue;
            }
            resp.headers_.remove(name);
            for (auto &value : values) {
                resp.headers_.append(name, std::move(value));
            }
        }
        resp.body_ = model::make_body(cached.body_);
        resp.status_ = static_cast<long>(model::HttpStatusCode::OK);
    }

    model::Response HttpCacheLayer::store_if_cacheable(const std::string &uri, model::Response resp) {
        if (resp.status_ != static_cast<long>(model::HttpStatusCode::OK)) {
            return resp;
        }
        auto key = CacheKey::extract_from_headers(resp.headers_);
        if (!key) {
            logging::logger()->debug("cache: {} carries no validator, not stored", uri);
            return resp;
        }

        std::unique_ptr<ICacheWriter> writer;
        try {
            writer = storage_->writer(uri, *key, resp.headers_);
        } catch (const std::exception &e) {
            logging::logger()->warn("cache: cannot open writer for {}: {}", uri, e.what());
            return resp;
        }
        logging::logger()->debug("cache: storing {} under {}", uri, key->value_);
        resp.body_ = std::make_unique<WriteToCacheBody>(std::move(resp.body_), std::move(writer));
        return resp;
    }
}  // namespace ghclient::cache
