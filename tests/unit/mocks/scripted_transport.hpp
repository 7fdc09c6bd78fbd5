#pragma once
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ghclient/client/interface.hpp"
#include "ghclient/error/errors.hpp"
#include "ghclient/model/model.hpp"

namespace ghclient::tests {

// Terminal transport that answers from a queue of canned replies and records
// every request it receives.
class ScriptedTransport : public client::IHttpClient {
public:
    ScriptedTransport &reply(long status, model::HeaderMap headers = {}, std::string body = "") {
        return reply_chunked(status, std::move(headers), {std::move(body)});
    }

    ScriptedTransport &reply_chunked(long status, model::HeaderMap headers, std::vector<std::string> chunks) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{.status_ = status, .headers_ = std::move(headers), .chunks_ = std::move(chunks)});
        return *this;
    }

    ScriptedTransport &fail(int code = 7, std::string message = "Couldn't connect to server") {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{.error_ = std::make_pair(code, std::move(message))});
        return *this;
    }

    model::Response send(model::Request req) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(req);
        if (script_.empty()) {
            throw std::logic_error("unexpected request to " + req.url_);
        }
        Step step = std::move(script_.front());
        script_.pop_front();
        if (step.error_) {
            throw error::TransportError(step.error_->first, req.url_, step.error_->second);
        }
        model::Response resp;
        resp.status_ = step.status_;
        resp.headers_ = std::move(step.headers_);
        resp.body_ = model::make_chunked_body(std::move(step.chunks_));
        resp.effective_url_ = req.url_;
        return resp;
    }

    std::vector<model::Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return script_.size();
    }

private:
    struct Step {
        long status_ = 0;
        model::HeaderMap headers_;
        std::vector<std::string> chunks_;
        std::optional<std::pair<int, std::string>> error_;
    };

    mutable std::mutex mutex_;
    std::deque<Step> script_;
    std::vector<model::Request> requests_;
};

// Lets a test keep a handle on a transport owned by a Pipeline.
class SharedTransport : public client::IHttpClient {
public:
    explicit SharedTransport(std::shared_ptr<client::IHttpClient> inner) : inner_(std::move(inner)) {}

    model::Response send(model::Request req) override { return inner_->send(std::move(req)); }

private:
    std::shared_ptr<client::IHttpClient> inner_;
};

}  // namespace ghclient::tests
