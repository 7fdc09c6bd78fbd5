#include "auth_header.hpp"

#include <stdexcept>

#include "../error/errors.hpp"
#include "../logging/logger.hpp"
#include "../utils/string_utils.hpp"

namespace ghclient::client {
    AuthHeaderLayer::AuthHeaderLayer(std::string header_value, const url::Url& base)
        : header_value_(std::move(header_value)), authority_(base.authority()) {
        if (header_value_.empty()) {
            throw std::invalid_argument("AuthHeaderLayer requires a header value");
        }
    }

    std::string AuthHeaderLayer::bearer(const std::string& token) { return "Bearer " + token; }

    bool AuthHeaderLayer::is_api_bound(const std::string& request_url) const {
        if (!url::Url::is_absolute(request_url)) {
            return true;
        }
        try {
            return string_utils::ieq(url::Url::parse(request_url).authority(), authority_);
        } catch (const error::UriError& e) {
            logging::logger()->debug("auth: not attaching credentials to unparsable URL: {}", e.what());
            return false;
        }
    }

    model::Response AuthHeaderLayer::handle(model::Request req, IHttpClient& next) {
        if (!req.headers_.contains(model::HeaderKeys::AUTHORIZATION) && is_api_bound(req.url_)) {
            req.headers_.set(model::HeaderKeys::AUTHORIZATION, header_value_);
        }
        return next.send(std::move(req));
    }
}  // namespace ghclient::client
