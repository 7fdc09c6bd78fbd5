#ifndef GHCLIENT_URL_HPP
#define GHCLIENT_URL_HPP

#include <curl/curl.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ghclient::url {
    // Absolute URL backed by libcurl's URL API.
    class Url {
       public:
        // Throws error::UriError when `s` is not an absolute URL.
        static Url parse(const std::string& s);
        static bool is_absolute(std::string_view s);

        Url(const Url& other);
        Url& operator=(const Url& other);
        Url(Url&&) noexcept = default;
        Url& operator=(Url&&) noexcept = default;
        ~Url() = default;

        [[nodiscard]] std::string str() const;
        [[nodiscard]] std::string scheme() const;
        [[nodiscard]] std::string host() const;
        [[nodiscard]] std::string path() const;
        [[nodiscard]] std::optional<std::string> query() const;
        // host:port with the scheme's default port filled in.
        [[nodiscard]] std::string authority() const;

        // First value of `name` in the query string, still percent-encoded.
        [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;

        // Appends a relative "/path?query" to this URL's path, keeping any
        // path prefix (e.g. "https://host/api/v3" + "/repos" -> "/api/v3/repos").
        [[nodiscard]] Url join(std::string_view relative) const;

       private:
        struct CurluDeleter {
            void operator()(CURLU* h) const { curl_url_cleanup(h); }
        };

        explicit Url(CURLU* handle);

        [[nodiscard]] std::optional<std::string> get_part(CURLUPart part, unsigned int flags = 0) const;
        void set_part(CURLUPart part, const char* value);

        std::unique_ptr<CURLU, CurluDeleter> handle_;
    };
}  // namespace ghclient::url

#endif
