#include "base_uri.hpp"

namespace ghclient::client {
    model::Response BaseUriLayer::handle(model::Request req, IHttpClient& next) {
        if (!url::Url::is_absolute(req.url_)) {
            req.url_ = base_.join(req.url_).str();
        }
        return next.send(std::move(req));
    }
}  // namespace ghclient::client
