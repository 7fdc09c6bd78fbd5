#ifndef GHCLIENT_MODEL_HPP
#define GHCLIENT_MODEL_HPP

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "body.hpp"
#include "headers.hpp"

namespace ghclient::model {
    enum class HttpStatusCode : long {
        OK = 200,
        NOT_MODIFIED = 304,
        BAD_REQUEST = 400,
        TOO_MANY_REQUESTS = 429,
        INTERNAL_SERVER_ERROR = 500,
        BAD_GATEWAY = 502,
        SERVICE_UNAVAILABLE = 503,
        GATEWAY_TIMEOUT = 504,
    };

    inline bool is_success(long status) { return status >= 200 && status < 300; }

    inline bool is_server_error(long status) { return status >= 500 && status < 600; }

    struct Request {
        std::string method_ = "GET";
        std::string url_;
        HeaderMap headers_;
        std::string body_;

        // One-shot streaming upload. A request carrying one cannot be replayed.
        std::shared_ptr<Body> body_stream_;

        std::stop_token stop_token_;
    };

    struct Response {
        long status_ = 0;
        HeaderMap headers_;
        std::unique_ptr<Body> body_;
        std::string effective_url_;

        // Drains the body; subsequent calls return an empty string.
        std::string text();
    };

    // Full reconstruction of `req` (method, URI, headers, body), or
    // std::nullopt when its body cannot be reproduced.
    std::optional<Request> clone_request(const Request& req);

    Request make_get(std::string url, std::stop_token stop_token = {});

    // Throws error::HttpError for a non-2xx status; the body is consumed for the error preview.
    void ensure_success(Response& resp);
}  // namespace ghclient::model

#endif
