#include "url.hpp"

#include <curl/curl.h>

#include <new>
#include <string>

#include "../error/errors.hpp"

namespace ghclient::url {
    Url::Url(CURLU* handle) : handle_(handle) {
        if (handle_ == nullptr) {
            throw std::bad_alloc();
        }
    }

    Url::Url(const Url& other) : Url(curl_url_dup(other.handle_.get())) {}

    Url& Url::operator=(const Url& other) {
        if (this != &other) {
            Url copy(other);
            handle_ = std::move(copy.handle_);
        }
        return *this;
    }

    Url Url::parse(const std::string& s) {
        Url u(curl_url());
        const CURLUcode rc = curl_url_set(u.handle_.get(), CURLUPART_URL, s.c_str(), 0);
        if (rc != CURLUE_OK) {
            throw error::UriError(s, std::string("invalid url (") + curl_url_strerror(rc) + ")");
        }
        return u;
    }

    bool Url::is_absolute(std::string_view s) {
        const auto colon = s.find("://");
        if (colon == std::string_view::npos || colon == 0) {
            return false;
        }
        for (size_t i = 0; i < colon; ++i) {
            const char c = s[i];
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (i > 0 && ((c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.'));
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> Url::get_part(CURLUPart part, unsigned int flags) const {
        char* out = nullptr;
        const CURLUcode rc = curl_url_get(handle_.get(), part, &out, flags);
        if (rc != CURLUE_OK || out == nullptr) {
            return std::nullopt;
        }
        std::string value(out);
        curl_free(out);
        return value;
    }

    void Url::set_part(CURLUPart part, const char* value) {
        const CURLUcode rc = curl_url_set(handle_.get(), part, value, 0);
        if (rc != CURLUE_OK) {
            throw error::UriError(value != nullptr ? value : "", std::string("invalid url component (") + curl_url_strerror(rc) + ")");
        }
    }

    std::string Url::str() const { return get_part(CURLUPART_URL).value_or(""); }

    std::string Url::scheme() const { return get_part(CURLUPART_SCHEME).value_or(""); }

    std::string Url::host() const { return get_part(CURLUPART_HOST).value_or(""); }

    std::string Url::path() const { return get_part(CURLUPART_PATH).value_or("/"); }

    std::optional<std::string> Url::query() const { return get_part(CURLUPART_QUERY); }

    std::string Url::authority() const {
        std::string out = host();
        if (auto port = get_part(CURLUPART_PORT, CURLU_DEFAULT_PORT)) {
            out += ":" + *port;
        }
        return out;
    }

    std::optional<std::string> Url::query_param(std::string_view name) const {
        const auto q = query();
        if (!q) {
            return std::nullopt;
        }
        std::string_view rest(*q);
        while (!rest.empty()) {
            const auto amp = rest.find('&');
            const std::string_view pair = rest.substr(0, amp);
            const auto eq = pair.find('=');
            if (pair.substr(0, eq) == name) {
                return eq == std::string_view::npos ? std::string{} : std::string(pair.substr(eq + 1));
            }
            if (amp == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(amp + 1);
        }
        return std::nullopt;
    }

    Url Url::join(std::string_view relative) const {
        Url out(*this);

        std::string_view rel_path = relative;
        std::optional<std::string> rel_query;
        if (const auto qmark = relative.find('?'); qmark != std::string_view::npos) {
            rel_path = relative.substr(0, qmark);
            rel_query = std::string(relative.substr(qmark + 1));
        }

        std::string base_path = path();
        while (!base_path.empty() && base_path.back() == '/') {
            base_path.pop_back();
        }
        std::string joined = base_path;
        if (rel_path.empty() || rel_path.front() != '/') {
            joined += '/';
        }
        joined += rel_path;

        out.set_part(CURLUPART_PATH, joined.c_str());
        out.set_part(CURLUPART_QUERY, rel_query ? rel_query->c_str() : nullptr);
        return out;
    }
}  // namespace ghclient::url
