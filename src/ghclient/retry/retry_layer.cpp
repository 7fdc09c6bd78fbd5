#include "retry_layer.hpp"

#include <optional>
#include <stdexcept>

#include "../error/errors.hpp"
#include "../logging/logger.hpp"

namespace ghclient::retry {
    RetryLayer::RetryLayer(RetryPolicy policy, std::shared_ptr<IDelay> delay, Clock clock)
        : policy_(policy), delay_(std::move(delay)), clock_(std::move(clock)) {
        if (delay_ == nullptr) {
            throw std::invalid_argument("RetryLayer requires a delay");
        }
        if (!clock_) {
            throw std::invalid_argument("RetryLayer requires a clock");
        }
    }

    model::Response RetryLayer::handle(model::Request req, client::IHttpClient &next) {
        if (policy_.exhausted()) {
            return next.send(std::move(req));
        }

        RetryPolicy state = policy_;
        for (size_t attempt = 1;; ++attempt) {
            std::optional<model::Request> copy = model::clone_request(req);
            if (!copy) {
                logging::logger()->debug("retry: body of {} {} cannot be replayed, sending once", req.method_, req.url_);
                return next.send(std::move(req));
            }

            std::optional<RetryDecision> decision;
            try {
                model::Response resp = next.send(std::move(*copy));
                decision = state.retry(resp, clock_());
                if (!decision) {
                    return resp;
                }
                logging::logger()->info("retry: {} {} returned {}, attempt {} retrying in {} ms ({} left)", req.method_, req.url_,
                                        resp.status_, attempt, decision->delay_.count(), decision->next_.count_);
            } catch (const error::TransportError &e) {
                decision = state.retry_after_error();
                if (!decision) {
                    throw;
                }
                logging::logger()->info("retry: {} {} failed ({}), attempt {} retrying in {} ms ({} left)", req.method_, req.url_, e.what(),
                                        attempt, decision->delay_.count(), decision->next_.count_);
            }

            delay_->wait(decision->delay_, req.stop_token_);
            state = decision->next_;
        }
    }
}  // namespace ghclient::retry
