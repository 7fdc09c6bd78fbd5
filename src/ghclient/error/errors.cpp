#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace ghclient::error {
    Error::Error(const std::string &msg) : std::runtime_error(msg) {}

    TransportError::TransportError(int code, std::string url, const std::string &msg) : Error(msg), code_(code), url_(std::move(url)) {}

    CancelledError::CancelledError(std::string url) : Error("request cancelled: " + url), url_(std::move(url)) {}

    CacheInconsistencyError::CacheInconsistencyError(std::string uri)
        : Error("304 Not Modified received but no cached response is stored for " + uri), uri_(std::move(uri)) {}

    DecodeError::DecodeError(std::string preview, const std::string &msg) : Error(msg), body_preview_(std::move(preview)) {}

    UriError::UriError(std::string uri, const std::string &msg) : Error(msg + ": " + uri), uri_(std::move(uri)) {}

    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : Error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}
}  // namespace ghclient::error
