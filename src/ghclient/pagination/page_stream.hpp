#ifndef GHCLIENT_PAGE_STREAM_HPP
#define GHCLIENT_PAGE_STREAM_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "../client/interface.hpp"
#include "../logging/logger.hpp"
#include "page.hpp"

namespace ghclient::pagination {
    // GET `url` through `http` and decode it as a page. Non-2xx statuses raise error::HttpError.
    template <typename T>
    Page<T> fetch_page(client::IHttpClient& http, std::string url, const PageParser& parser, const json::ItemDecoder<T>& decode,
                       std::stop_token stop_token = {}) {
        model::Response resp = http.send(model::make_get(std::move(url), std::move(stop_token)));
        model::ensure_success(resp);
        return Page<T>::from_response(resp, parser, decode);
    }

    // Forward-only sequence over every item of a paginated collection.
    //
    // The next page is requested only once every item of the current one has
    // been handed out. An empty page ends the sequence even when it links to
    // another one. A failure while fetching or decoding a page is thrown from
    // next() and leaves the stream finished; items already returned are not
    // affected. Destroying the stream, or request_stop() from another thread,
    // cancels an in-flight fetch or retry delay.
    template <typename T>
    class PageStream {
       public:
        PageStream(Page<T> first, std::shared_ptr<client::IHttpClient> http, std::shared_ptr<const PageParser> parser,
                   json::ItemDecoder<T> decode)
            : items_(first.take_items()),
              next_(std::move(first.next_)),
              http_(std::move(http)),
              parser_(std::move(parser)),
              decode_(std::move(decode)) {
            if (http_ == nullptr || parser_ == nullptr || !decode_) {
                throw std::invalid_argument("PageStream requires a client, a page parser and an item decoder");
            }
        }

        ~PageStream() { stop_.request_stop(); }

        PageStream(const PageStream&) = delete;
        PageStream& operator=(const PageStream&) = delete;
        PageStream(PageStream&&) noexcept = default;
        PageStream& operator=(PageStream&&) = delete;

        std::optional<T> next() {
            while (true) {
                if (cursor_ < items_.size()) {
                    return std::move(items_[cursor_++]);
                }
                if (finished_ || !next_) {
                    finished_ = true;
                    return std::nullopt;
                }

                const std::string target = next_->str();
                next_.reset();
                items_.clear();
                cursor_ = 0;
                // Stays set if the fetch throws.
                finished_ = true;

                logging::logger()->debug("pagination: fetching {}", target);
                Page<T> page = fetch_page<T>(*http_, target, *parser_, decode_, stop_.get_token());
                ++pages_fetched_;

                if (page.items_.empty()) {
                    logging::logger()->debug("pagination: {} returned no items, stopping", target);
                    return std::nullopt;
                }
                items_ = page.take_items();
                next_ = std::move(page.next_);
                finished_ = false;
            }
        }

        // Drains the remaining items.
        std::vector<T> collect() {
            std::vector<T> out;
            while (auto item = next()) {
                out.push_back(std::move(*item));
            }
            return out;
        }

        void request_stop() { stop_.request_stop(); }

        [[nodiscard]] bool finished() const { return finished_ && cursor_ >= items_.size(); }
        [[nodiscard]] size_t pages_fetched() const { return pages_fetched_; }

        class iterator {
           public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = T*;
            using reference = T&;

            iterator() = default;
            explicit iterator(PageStream* stream) : stream_(stream) { advance(); }

            reference operator*() const { return *stream_->current_; }
            pointer operator->() const { return &*stream_->current_; }

            iterator& operator++() {
                advance();
                return *this;
            }
            void operator++(int) { advance(); }

            friend bool operator==(const iterator& it, std::default_sentinel_t) { return it.stream_ == nullptr; }

           private:
            void advance() {
                stream_->current_ = stream_->next();
                if (!stream_->current_) {
                    stream_ = nullptr;
                }
            }

            PageStream* stream_ = nullptr;
        };

        iterator begin() { return iterator(this); }
        std::default_sentinel_t end() { return {}; }

       private:
        std::vector<T> items_;
        size_t cursor_ = 0;
        std::optional<url::Url> next_;
        std::optional<T> current_;
        bool finished_ = false;
        size_t pages_fetched_ = 0;

        std::shared_ptr<client::IHttpClient> http_;
        std::shared_ptr<const PageParser> parser_;
        json::ItemDecoder<T> decode_;
        std::stop_source stop_;
    };

    template <typename T>
    PageStream<T> Page<T>::into_stream(std::shared_ptr<client::IHttpClient> http, std::shared_ptr<const PageParser> parser,
                                       json::ItemDecoder<T> decode) && {
        return PageStream<T>(std::move(*this), std::move(http), std::move(parser), std::move(decode));
    }
}  // namespace ghclient::pagination

#endif
