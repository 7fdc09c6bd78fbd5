#ifndef GHCLIENT_LINK_HEADER_HPP
#define GHCLIENT_LINK_HEADER_HPP

#include <optional>
#include <string_view>

#include "../model/headers.hpp"
#include "../url/url.hpp"

namespace ghclient::pagination {
    struct HeaderLinks {
        std::optional<url::Url> first_;
        std::optional<url::Url> prev_;
        std::optional<url::Url> next_;
        std::optional<url::Url> last_;
    };

    // Parses `<url>; rel="name", ...`. Only first/prev/next/last are kept;
    // other rel values are skipped. Throws error::UriError for a URL that is
    // not absolute.
    HeaderLinks parse_link_header(std::string_view value);

    // Links from every Link field of `headers`; empty when there is none.
    HeaderLinks get_links(const model::HeaderMap& headers);
}  // namespace ghclient::pagination

#endif
