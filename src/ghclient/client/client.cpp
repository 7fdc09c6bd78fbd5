#include "client.hpp"

#include <chrono>
#include <stdexcept>

#include "../cache/cache_layer.hpp"
#include "../cache/disk_cache.hpp"
#include "../cache/in_memory_cache.hpp"
#include "../cache/no_cache.hpp"
#include "../logging/logger.hpp"
#include "auth_header.hpp"
#include "base_uri.hpp"
#include "curl_transport.hpp"
#include "pipeline.hpp"

namespace ghclient::client {
    Client::Client(std::shared_ptr<IHttpClient> pipeline, std::shared_ptr<const pagination::PageParser> page_parser)
        : pipeline_(std::move(pipeline)), page_parser_(std::move(page_parser)) {
        if (pipeline_ == nullptr || page_parser_ == nullptr) {
            throw std::invalid_argument("Client requires a pipeline and a page parser");
        }
    }

    model::Response Client::execute(model::Request req) { return pipeline_->send(std::move(req)); }

    //
    // ClientBuilder implementation
    //

    ClientBuilder::ClientBuilder() : delay_(std::make_shared<retry::ThreadDelay>()), clock_(std::chrono::system_clock::now) {}

    ClientBuilder& ClientBuilder::with_transport(std::unique_ptr<IHttpClient> transport) {
        transport_ = std::move(transport);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_cache(std::shared_ptr<cache::ICacheStorage> storage) {
        cache_ = std::move(storage);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_retry(retry::RetryPolicy policy) {
        retry_policy_ = policy;
        return *this;
    }

    ClientBuilder& ClientBuilder::with_delay(std::shared_ptr<retry::IDelay> delay) {
        delay_ = std::move(delay);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_clock(retry::RetryLayer::Clock clock) {
        clock_ = std::move(clock);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_base_url(std::string base_url) {
        base_url_ = std::move(base_url);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_auth_token(const std::string& token) { return with_auth_header(AuthHeaderLayer::bearer(token)); }

    ClientBuilder& ClientBuilder::with_auth_header(std::string header_value) {
        auth_header_ = std::move(header_value);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_page_attribute(std::string attribute) {
        page_attributes_.push_back(std::move(attribute));
        return *this;
    }

    ClientBuilder& ClientBuilder::with_middleware(std::unique_ptr<IMiddleware> middleware) {
        middlewares_.push_back(std::move(middleware));
        return *this;
    }

    ClientBuilder& ClientBuilder::validate() {
        if (transport_ == nullptr) {
            throw std::runtime_error("Transport is required");
        }
        if (delay_ == nullptr) {
            throw std::runtime_error("Retry delay is required");
        }
        if (!clock_) {
            throw std::runtime_error("Retry clock is required");
        }
        if (auth_header_ && auth_header_->empty()) {
            throw std::runtime_error("Authorization header must not be empty");
        }
        for (const auto& middleware : middlewares_) {
            if (middleware == nullptr) {
                throw std::runtime_error("Middleware must not be null");
            }
        }
        // Throws error::UriError.
        (void)url::Url::parse(base_url_);
        return *this;
    }

    std::unique_ptr<Client> ClientBuilder::build() {
        const url::Url base = url::Url::parse(base_url_);

        std::vector<std::unique_ptr<IMiddleware>> layers;
        layers.push_back(std::make_unique<BaseUriLayer>(base));
        if (auth_header_) {
            layers.push_back(std::make_unique<AuthHeaderLayer>(*auth_header_, base));
        }
        for (auto& middleware : middlewares_) {
            layers.push_back(std::move(middleware));
        }
        middlewares_.clear();
        if (!retry_policy_.exhausted()) {
            layers.push_back(std::make_unique<retry::RetryLayer>(retry_policy_, delay_, clock_));
        }
        if (cache_ != nullptr) {
            layers.push_back(std::make_unique<cache::HttpCacheLayer>(cache_));
        }

        auto parser = std::make_shared<pagination::PageParser>();
        for (auto& attribute : page_attributes_) {
            parser->add_attribute(attribute);
        }

        logging::logger()->debug("client: built pipeline for {} with {} layers", base.str(), layers.size());
        auto pipeline = std::make_shared<Pipeline>(std::move(layers), std::move(transport_));
        return std::make_unique<Client>(std::move(pipeline), std::move(parser));
    }

    ClientBuilder ClientBuilder::from_config(const ClientConfig& config) {
        if (config.log_level_) {
            logging::set_level(*config.log_level_);
        }

        ClientBuilder builder;
        builder.with_transport(std::make_unique<CurlTransport>(CurlOptions{
                   .connect_timeout_ms_ = config.connect_timeout_ms_,
                   .timeout_ms_ = config.timeout_ms_,
                   .user_agent_ = config.user_agent_,
               }))
            .with_retry(config.retry_policy_)
            .with_base_url(config.base_url_);

        switch (config.cache_mode_) {
            case CacheMode::NONE:
                builder.with_cache(std::make_shared<cache::NoCache>());
                break;
            case CacheMode::MEMORY:
                builder.with_cache(std::make_shared<cache::InMemoryCache>());
                break;
            case CacheMode::DISK:
                builder.with_cache(std::make_shared<cache::DiskCache>(config.cache_dir_));
                break;
        }

        if (config.auth_token_) {
            builder.with_auth_token(*config.auth_token_);
        }
        for (const auto& attribute : config.extra_page_attributes_) {
            builder.with_page_attribute(attribute);
        }
        return builder;
    }
}  // namespace ghclient::client
