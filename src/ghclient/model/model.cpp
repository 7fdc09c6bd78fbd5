#include "model.hpp"

#include <string>

#include "../error/errors.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace ghclient::model {
    std::string Response::text() {
        std::string out = read_to_string(body_.get());
        body_.reset();
        return out;
    }

    std::optional<Request> clone_request(const Request& req) {
        if (req.body_stream_ != nullptr) {
            return std::nullopt;
        }
        return Request{
            .method_ = req.method_,
            .url_ = req.url_,
            .headers_ = req.headers_,
            .body_ = req.body_,
            .body_stream_ = nullptr,
            .stop_token_ = req.stop_token_,
        };
    }

    Request make_get(std::string url, std::stop_token stop_token) {
        Request r;
        r.method_ = "GET";
        r.url_ = std::move(url);
        r.headers_.set(HeaderKeys::ACCEPT, constants::JSON_ACCEPT);
        r.stop_token_ = std::move(stop_token);
        return r;
    }

    void ensure_success(Response& resp) {
        if (is_success(resp.status_)) {
            return;
        }
        const std::string body = resp.text();
        throw error::HttpError(resp.status_, resp.effective_url_, string_utils::preview(body, constants::BODY_PREVIEW_LENGTH),
                               "HTTP request failed with status " + std::to_string(resp.status_));
    }
}  // namespace ghclient::model
