#ifndef GHCLIENT_PAGE_HPP
#define GHCLIENT_PAGE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../client/interface.hpp"
#include "../json/json_decode.hpp"
#include "../model/model.hpp"
#include "../url/url.hpp"
#include "../utils/string_utils.hpp"
#include "link_header.hpp"
#include "page_parser.hpp"

namespace ghclient::pagination {
    template <typename T>
    class PageStream;

    // One page of a paginated collection.
    template <typename T>
    struct Page {
        std::vector<T> items_;
        std::optional<bool> incomplete_results_;
        std::optional<uint64_t> total_count_;
        std::optional<url::Url> next_;
        std::optional<url::Url> prev_;
        std::optional<url::Url> first_;
        std::optional<url::Url> last_;

        // Returns the items, leaving the page empty.
        std::vector<T> take_items() { return std::exchange(items_, {}); }

        // The `page` query parameter of the `last` link, if any.
        [[nodiscard]] std::optional<uint32_t> number_of_pages() const {
            if (!last_) {
                return std::nullopt;
            }
            auto page = last_->query_param("page");
            if (!page) {
                return std::nullopt;
            }
            auto n = string_utils::parse_long(*page);
            if (!n || *n < 0 || *n > static_cast<long long>(UINT32_MAX)) {
                return std::nullopt;
            }
            return static_cast<uint32_t>(*n);
        }

        auto begin() { return items_.begin(); }
        auto end() { return items_.end(); }
        auto begin() const { return items_.begin(); }
        auto end() const { return items_.end(); }

        // Decodes the body and the Link header of `resp`. The body is consumed.
        static Page from_response(model::Response& resp, const PageParser& parser, const json::ItemDecoder<T>& decode) {
            HeaderLinks links = get_links(resp.headers_);
            const std::string body = resp.text();
            json::Document doc(body);
            PageEnvelope envelope = parser.locate(doc);

            Page page;
            page.items_ = json::decode_array<T>(doc, envelope.items_, decode);
            page.incomplete_results_ = envelope.incomplete_results_;
            page.total_count_ = envelope.total_count_;
            page.next_ = std::move(links.next_);
            page.prev_ = std::move(links.prev_);
            page.first_ = std::move(links.first_);
            page.last_ = std::move(links.last_);
            return page;
        }

        // Lazily yields the items of this page and of every page reachable
        // through `next`, fetching each one through `http`.
        PageStream<T> into_stream(std::shared_ptr<client::IHttpClient> http, std::shared_ptr<const PageParser> parser,
                                  json::ItemDecoder<T> decode) &&;
    };
}  // namespace ghclient::pagination

#include "page_stream.hpp"

#endif
