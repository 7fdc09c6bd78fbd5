#ifndef GHCLIENT_HEADERS_HPP
#define GHCLIENT_HEADERS_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ghclient::model {
    struct HeaderKeys {
        static constexpr const char* AUTHORIZATION = "Authorization";
        static constexpr const char* ACCEPT = "Accept";
        static constexpr const char* CONTENT_LENGTH = "Content-Length";
        static constexpr const char* CONTENT_TYPE = "Content-Type";
        static constexpr const char* ETAG = "ETag";
        static constexpr const char* LAST_MODIFIED = "Last-Modified";
        static constexpr const char* IF_NONE_MATCH = "If-None-Match";
        static constexpr const char* IF_MODIFIED_SINCE = "If-Modified-Since";
        static constexpr const char* LINK = "Link";
        static constexpr const char* RETRY_AFTER = "Retry-After";
        static constexpr const char* X_RATELIMIT_REMAINING = "X-RateLimit-Remaining";
        static constexpr const char* X_RATELIMIT_RESET = "X-RateLimit-Reset";
    };

    // Ordered multimap of header fields. Name lookups are ASCII case-insensitive.
    class HeaderMap {
       public:
        using Field = std::pair<std::string, std::string>;

        HeaderMap() = default;
        HeaderMap(std::initializer_list<Field> fields);

        void append(std::string name, std::string value);
        // Replaces every field named `name` with a single one.
        void set(const std::string& name, std::string value);
        size_t remove(std::string_view name);

        [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
        [[nodiscard]] std::vector<std::string> get_all(std::string_view name) const;
        [[nodiscard]] bool contains(std::string_view name) const;

        [[nodiscard]] size_t size() const { return fields_.size(); }
        [[nodiscard]] bool empty() const { return fields_.empty(); }
        void clear() { fields_.clear(); }

        [[nodiscard]] std::vector<Field>::const_iterator begin() const { return fields_.begin(); }
        [[nodiscard]] std::vector<Field>::const_iterator end() const { return fields_.end(); }

        // Parses one raw "Name: value\r\n" line as delivered by the transport.
        static std::optional<Field> parse_line(std::string_view line);

        bool operator==(const HeaderMap& other) const = default;

       private:
        std::vector<Field> fields_;
    };
}  // namespace ghclient::model

#endif
