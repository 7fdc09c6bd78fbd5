#ifndef GHCLIENT_CLIENT_HPP
#define GHCLIENT_CLIENT_HPP

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "../cache/cache_storage.hpp"
#include "../json/json_decode.hpp"
#include "../model/model.hpp"
#include "../pagination/page.hpp"
#include "../pagination/page_parser.hpp"
#include "../pagination/page_stream.hpp"
#include "../retry/delay.hpp"
#include "../retry/retry_layer.hpp"
#include "../retry/retry_policy.hpp"
#include "../url/url.hpp"
#include "config.hpp"
#include "interface.hpp"

namespace ghclient::client {
    class Client {
       public:
        Client(std::shared_ptr<IHttpClient> pipeline, std::shared_ptr<const pagination::PageParser> page_parser);

        // Sends `req` through the middleware stack. The response is returned
        // whatever its status.
        model::Response execute(model::Request req);

        // GET `url` (absolute, or relative to the base URL) and decode the body.
        // Throws error::HttpError for a non-2xx status and error::DecodeError
        // for a body that does not decode.
        template <typename T>
        T get(const std::string& url, json::ItemDecoder<T> decode = json::default_decoder<T>(), std::stop_token stop_token = {}) {
            model::Response resp = execute(model::make_get(url, std::move(stop_token)));
            model::ensure_success(resp);
            const std::string body = resp.text();
            return json::decode_document<T>(body, decode);
        }

        template <typename T>
        pagination::Page<T> get_page(const std::string& url, const json::ItemDecoder<T>& decode = json::default_decoder<T>(),
                                     std::stop_token stop_token = {}) {
            return pagination::fetch_page<T>(*pipeline_, url, *page_parser_, decode, std::move(stop_token));
        }

        // Follows an optional navigation link such as Page::next_; std::nullopt when there is none.
        template <typename T>
        std::optional<pagination::Page<T>> get_page(const std::optional<url::Url>& url,
                                                    const json::ItemDecoder<T>& decode = json::default_decoder<T>(),
                                                    std::stop_token stop_token = {}) {
            if (!url) {
                return std::nullopt;
            }
            return get_page<T>(url->str(), decode, std::move(stop_token));
        }

        template <typename T>
        pagination::PageStream<T> stream(pagination::Page<T> page, json::ItemDecoder<T> decode = json::default_decoder<T>()) {
            return std::move(page).into_stream(pipeline_, page_parser_, std::move(decode));
        }

        // Every item of `page` and of the pages after it.
        template <typename T>
        std::vector<T> all_pages(pagination::Page<T> page, json::ItemDecoder<T> decode = json::default_decoder<T>()) {
            return stream<T>(std::move(page), std::move(decode)).collect();
        }

        [[nodiscard]] const std::shared_ptr<IHttpClient>& pipeline() const { return pipeline_; }
        [[nodiscard]] const pagination::PageParser& page_parser() const { return *page_parser_; }

       private:
        std::shared_ptr<IHttpClient> pipeline_;
        std::shared_ptr<const pagination::PageParser> page_parser_;
    };

    // Assembles the middleware stack, outermost first:
    // base URL, authorization, extra middlewares, retry, cache, transport.
    class ClientBuilder {
       public:
        ClientBuilder();

        ClientBuilder& with_transport(std::unique_ptr<IHttpClient> transport);
        ClientBuilder& with_cache(std::shared_ptr<cache::ICacheStorage> storage);
        ClientBuilder& with_retry(retry::RetryPolicy policy);
        ClientBuilder& with_delay(std::shared_ptr<retry::IDelay> delay);
        ClientBuilder& with_clock(retry::RetryLayer::Clock clock);
        ClientBuilder& with_base_url(std::string base_url);
        ClientBuilder& with_auth_token(const std::string& token);
        ClientBuilder& with_auth_header(std::string header_value);
        ClientBuilder& with_page_attribute(std::string attribute);
        ClientBuilder& with_middleware(std::unique_ptr<IMiddleware> middleware);
        ClientBuilder& validate();
        std::unique_ptr<Client> build();

        // Curl transport, cache backend, retry policy, base URL, token, page
        // attributes and log level taken from `config`.
        static ClientBuilder from_config(const ClientConfig& config);

       private:
        std::unique_ptr<IHttpClient> transport_;
        std::shared_ptr<cache::ICacheStorage> cache_;
        retry::RetryPolicy retry_policy_ = retry::RetryPolicy::none();
        std::shared_ptr<retry::IDelay> delay_;
        retry::RetryLayer::Clock clock_;
        std::string base_url_ = constants::DEFAULT_BASE_URL;
        std::optional<std::string> auth_header_;
        std::vector<std::string> page_attributes_;
        std::vector<std::unique_ptr<IMiddleware>> middlewares_;
    };
}  // namespace ghclient::client

#endif
