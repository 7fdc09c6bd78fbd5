#ifndef GHCLIENT_ERRORS_HPP
#define GHCLIENT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ghclient::error {
    struct Error : public std::runtime_error {
        explicit Error(const std::string &msg);
    };

    // Send/connect failure reported by the transport.
    struct TransportError : public Error {
        int code_;
        std::string url_;
        explicit TransportError(int code, std::string url, const std::string &msg);
    };

    struct CancelledError : public Error {
        std::string url_;
        explicit CancelledError(std::string url);
    };

    // A 304 arrived for a URI the cache storage holds no response for.
    struct CacheInconsistencyError : public Error {
        std::string uri_;
        explicit CacheInconsistencyError(std::string uri);
    };

    struct DecodeError : public Error {
        std::string body_preview_;
        explicit DecodeError(std::string preview, const std::string &msg);
    };

    struct UriError : public Error {
        std::string uri_;
        explicit UriError(std::string uri, const std::string &msg);
    };

    struct HttpError : public Error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };
}  // namespace ghclient::error

#endif
