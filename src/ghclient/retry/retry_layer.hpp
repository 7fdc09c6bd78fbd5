#ifndef GHCLIENT_RETRY_LAYER_HPP
#define GHCLIENT_RETRY_LAYER_HPP

#include <chrono>
#include <functional>
#include <memory>

#include "../client/interface.hpp"
#include "../model/model.hpp"
#include "delay.hpp"
#include "retry_policy.hpp"

namespace ghclient::retry {
    // Re-issues a request while the policy allows it. Each attempt sends a
    // fresh copy of the original request; a request whose body cannot be
    // copied is sent exactly once. The last response, or the last exception,
    // reaches the caller unchanged.
    class RetryLayer : public client::IMiddleware {
       public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        RetryLayer(RetryPolicy policy, std::shared_ptr<IDelay> delay, Clock clock = std::chrono::system_clock::now);

        model::Response handle(model::Request req, client::IHttpClient &next) override;

        [[nodiscard]] const RetryPolicy &policy() const { return policy_; }

       private:
        RetryPolicy policy_;
        std::shared_ptr<IDelay> delay_;
        Clock clock_;
    };
}  // namespace ghclient::retry

#endif
