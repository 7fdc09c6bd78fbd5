#include "curl_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../error/errors.hpp"
#include "../logging/logger.hpp"
#include "../model/model.hpp"

namespace ghclient::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 0L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr long NO_BODY = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
    };

    struct CurlTransport::TransferState {
        model::HeaderMap headers_;
        std::vector<std::string> chunks_;

        model::Body* upload_ = nullptr;
        std::string pending_upload_;
        size_t pending_offset_ = 0;
        std::exception_ptr upload_error_;

        std::stop_token stop_token_;
    };

    CurlTransport::CurlTransport(CurlOptions options) : options_(std::move(options)), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlTransport::~CurlTransport() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlTransport::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        // Redirects are surfaced to the caller; the cache and retry layers key on the requested URI.
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms_);
        setopt(CURLOPT_TIMEOUT_MS, options_.timeout_ms_);
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps

        if (options_.enable_keepalive_) {
            setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
            setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
            setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
        }
        if (options_.enable_compression_) {
            // Empty string => accept all supported encodings (gzip/deflate/br)
            setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        }
        if (options_.prefer_http2_tls_) {
            setopt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS));
        }
    }

    void CurlTransport::set_headers(const model::HeaderMap& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            const std::string line = name + ": " + value;
            curl_slist* appended = curl_slist_append(headers_, line.c_str());
            if (appended == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = appended;
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlTransport::prepare_for_new_request(const model::Request& req, TransferState& state) {
        error_buf_[0] = '\0';
        state.stop_token_ = req.stop_token_;

        setopt(CURLOPT_URL, req.url_.c_str());
        set_headers(req.headers_);

        // Always reset the verb state (don't rely on old values)
        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);

        setopt(CURLOPT_WRITEFUNCTION, &CurlTransport::write_cb);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&state));
        setopt(CURLOPT_HEADERFUNCTION, &CurlTransport::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(&state));

        if (state.stop_token_.stop_possible()) {
            setopt(CURLOPT_NOPROGRESS, 0L);
            setopt(CURLOPT_XFERINFOFUNCTION, &CurlTransport::xferinfo_cb);
            setopt(CURLOPT_XFERINFODATA, static_cast<void*>(&state));
        } else {
            setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        }

        apply_method(req, state);
    }

    void CurlTransport::apply_method(const model::Request& req, TransferState& state) {
        const std::string& method = req.method_;

        if (method == "HEAD") {
            setopt(CURLOPT_NOBODY, 1L);
            return;
        }

        if (req.body_stream_ != nullptr) {
            state.upload_ = req.body_stream_.get();
            setopt(CURLOPT_UPLOAD, 1L);
            setopt(CURLOPT_READFUNCTION, &CurlTransport::read_cb);
            setopt(CURLOPT_READDATA, static_cast<void*>(&state));
            if (auto hint = req.body_stream_->size_hint()) {
                setopt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*hint));
            }
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
            return;
        }

        if (!req.body_.empty() || method == "POST" || method == "PUT" || method == "PATCH") {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_.size()));
            setopt(CURLOPT_POSTFIELDS, req.body_.c_str());
            if (method != "POST") {
                setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
            }
            return;
        }

        if (method != "GET") {
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    }

    size_t CurlTransport::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t bytes = size * n_items;
        const std::string_view line(buffer, bytes);

        // A status line opens a new header block (interim 1xx responses); only the final block is kept.
        if (line.starts_with("HTTP/")) {
            state->headers_.clear();
            return bytes;
        }

        if (auto field = model::HeaderMap::parse_line(line)) {
            state->headers_.append(std::move(field->first), std::move(field->second));
        }

        return bytes;
    }

    size_t CurlTransport::write_cb(char* ptr, size_t size, size_t n_items, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t total = size * n_items;
        state->chunks_.emplace_back(ptr, total);
        return total;
    }

    size_t CurlTransport::read_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t capacity = size * n_items;

        while (state->pending_offset_ >= state->pending_upload_.size()) {
            std::optional<std::string> chunk;
            try {
                chunk = state->upload_->next_chunk();
            } catch (...) {
                // Rethrown by perform_throw once curl has unwound.
                state->upload_error_ = std::current_exception();
                return CURL_READFUNC_ABORT;
            }
            if (!chunk) {
                return 0;
            }
            state->pending_upload_ = std::move(*chunk);
            state->pending_offset_ = 0;
        }

        const size_t n = std::min(capacity, state->pending_upload_.size() - state->pending_offset_);
        std::memcpy(buffer, state->pending_upload_.data() + state->pending_offset_, n);
        state->pending_offset_ += n;
        return n;
    }

    int CurlTransport::xferinfo_cb(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        const auto* state = static_cast<const TransferState*>(userdata);
        return state->stop_token_.stop_requested() ? 1 : 0;
    }

    model::Response CurlTransport::send(model::Request req) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (req.stop_token_.stop_requested()) {
            throw error::CancelledError(req.url_);
        }

        TransferState state;
        prepare_for_new_request(req, state);
        perform_throw(req, state);
        return make_response(state);
    }

    template <typename T>
    void CurlTransport::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlTransport::perform_throw(const model::Request& req, TransferState& state) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        if (state.upload_error_) {
            std::rethrow_exception(state.upload_error_);
        }

        if (rc == CURLE_ABORTED_BY_CALLBACK && state.stop_token_.stop_requested()) {
            throw error::CancelledError(req.url_);
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        logging::logger()->debug("{} {}: {}", req.method_, req.url_, err);
        throw error::TransportError(static_cast<int>(rc), req.url_, err);
    }

    model::Response CurlTransport::make_response(TransferState& state) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        model::Response r;
        r.status_ = code;
        r.headers_ = std::move(state.headers_);
        r.body_ = model::make_chunked_body(std::move(state.chunks_));
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        return r;
    }

}  // namespace ghclient::client
