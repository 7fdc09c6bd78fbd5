#ifndef GHCLIENT_CURL_TRANSPORT_HPP
#define GHCLIENT_CURL_TRANSPORT_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>
#include <string>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace ghclient::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    struct CurlOptions {
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
        std::string user_agent_ = "ghclient/1.0";
        bool enable_compression_ = true;
        bool enable_keepalive_ = true;
        bool prefer_http2_tls_ = true;
    };

    // Terminal transport over one libcurl easy handle. Transfers on the same
    // instance are serialised.
    class CurlTransport : public IHttpClient {
       public:
        explicit CurlTransport(CurlOptions options = {});

        ~CurlTransport() override;
        CurlTransport(const CurlTransport&) = delete;
        CurlTransport& operator=(const CurlTransport&) = delete;
        CurlTransport(CurlTransport&&) = delete;
        CurlTransport& operator=(CurlTransport&&) = delete;

        model::Response send(model::Request req) override;

       private:
        struct TransferState;

        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_defaults_once();
        void set_headers(const model::HeaderMap& hs);
        void prepare_for_new_request(const model::Request& req, TransferState& state);
        void apply_method(const model::Request& req, TransferState& state);
        void perform_throw(const model::Request& req, TransferState& state);
        model::Response make_response(TransferState& state);

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static size_t write_cb(char* ptr, size_t size, size_t n_items, void* userdata);
        static size_t read_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int xferinfo_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

        CurlOptions options_;
        std::mutex mutex_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace ghclient::client

#endif
