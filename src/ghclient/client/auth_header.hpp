#ifndef GHCLIENT_AUTH_HEADER_HPP
#define GHCLIENT_AUTH_HEADER_HPP

#include <string>

#include "../model/model.hpp"
#include "../url/url.hpp"
#include "interface.hpp"

namespace ghclient::client {
    // Adds an Authorization header to requests bound for the API host. Requests
    // to any other authority, and requests that already carry the header, are
    // passed through unchanged.
    class AuthHeaderLayer : public IMiddleware {
       public:
        AuthHeaderLayer(std::string header_value, const url::Url& base);

        // "Bearer <token>".
        static std::string bearer(const std::string& token);

        model::Response handle(model::Request req, IHttpClient& next) override;

       private:
        [[nodiscard]] bool is_api_bound(const std::string& request_url) const;

        std::string header_value_;
        std::string authority_;
    };
}  // namespace ghclient::client

#endif
