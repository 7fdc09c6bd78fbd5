#ifndef GHCLIENT_BASE_URI_HPP
#define GHCLIENT_BASE_URI_HPP

#include "../model/model.hpp"
#include "../url/url.hpp"
#include "interface.hpp"

namespace ghclient::client {
    // Resolves relative request URLs ("/repos/o/r?page=2") against a base URL,
    // keeping any path the base carries. Absolute URLs are left alone.
    class BaseUriLayer : public IMiddleware {
       public:
        explicit BaseUriLayer(url::Url base) : base_(std::move(base)) {}

        model::Response handle(model::Request req, IHttpClient& next) override;

        [[nodiscard]] const url::Url& base() const { return base_; }

       private:
        url::Url base_;
    };
}  // namespace ghclient::client

#endif
