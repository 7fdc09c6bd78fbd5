#include "retry_policy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace ghclient::retry {
    using std::chrono::milliseconds;

    RetryPolicy RetryPolicy::none() { return RetryPolicy{}; }

    RetryPolicy RetryPolicy::simple(std::size_t count) { return RetryPolicy{.mode_ = Mode::COUNT, .count_ = count}; }

    RetryPolicy RetryPolicy::backoff(milliseconds fallback, milliseconds max, std::size_t count) {
        return RetryPolicy{.mode_ = Mode::BACKOFF, .count_ = count, .fallback_delay_ = fallback, .max_delay_ = max};
    }

    std::optional<milliseconds> delay_from_headers(const model::HeaderMap &headers, std::chrono::system_clock::time_point now) {
        constexpr long long MAX_MS = milliseconds::max().count();
        constexpr long long MAX_SECONDS = MAX_MS / constants::MILLISECONDS_PER_SECOND;

        if (auto retry_after = headers.get(model::HeaderKeys::RETRY_AFTER)) {
            if (auto seconds = string_utils::parse_double(*retry_after); seconds && *seconds >= 0.0) {
                // Values past the representable range saturate; the caller clamps to max_delay_.
                if (*seconds >= static_cast<double>(MAX_SECONDS)) {
                    return milliseconds::max();
                }
                return milliseconds(std::llround(*seconds * constants::MILLISECONDS_PER_SECOND));
            }
        }
        if (auto reset = headers.get(model::HeaderKeys::X_RATELIMIT_RESET)) {
            if (auto epoch = string_utils::parse_long(*reset)) {
                if (*epoch > MAX_SECONDS) {
                    return milliseconds::max();
                }
                const long long now_ms = std::chrono::duration_cast<milliseconds>(now.time_since_epoch()).count();
                if (*epoch < -MAX_SECONDS || *epoch * constants::MILLISECONDS_PER_SECOND <= now_ms) {
                    return milliseconds(0);
                }
                return milliseconds(*epoch * constants::MILLISECONDS_PER_SECOND - now_ms);
            }
        }
        return std::nullopt;
    }

    bool is_retryable(const model::Response &resp, std::chrono::system_clock::time_point now) {
        if (model::is_server_error(resp.status_) || resp.status_ == static_cast<long>(model::HttpStatusCode::TOO_MANY_REQUESTS)) {
            return true;
        }
        return resp.status_ == static_cast<long>(model::HttpStatusCode::BAD_REQUEST) && delay_from_headers(resp.headers_, now).has_value();
    }

    static RetryDecision fallback_decision(const RetryPolicy &policy) {
        RetryPolicy next = policy;
        next.count_ = policy.count_ - 1;
        // Doubling saturates at max_delay_.
        next.fallback_delay_ = std::min(policy.fallback_delay_ * 2, std::max(policy.max_delay_, policy.fallback_delay_));
        return RetryDecision{.next_ = next, .delay_ = std::min(policy.fallback_delay_, policy.max_delay_)};
    }

    std::optional<RetryDecision> RetryPolicy::retry(const model::Response &resp, std::chrono::system_clock::time_point now) const {
        if (exhausted() || !is_retryable(resp, now)) {
            return std::nullopt;
        }

        if (mode_ == Mode::COUNT) {
            RetryPolicy next = *this;
            next.count_ = count_ - 1;
            return RetryDecision{.next_ = next, .delay_ = milliseconds(0)};
        }

        if (auto delay = delay_from_headers(resp.headers_, now)) {
            RetryPolicy next = *this;
            next.count_ = count_ - 1;
            return RetryDecision{.next_ = next, .delay_ = std::min(*delay, max_delay_)};
        }
        return fallback_decision(*this);
    }

    std::optional<RetryDecision> RetryPolicy::retry_after_error() const {
        if (exhausted()) {
            return std::nullopt;
        }
        if (mode_ == Mode::COUNT) {
            RetryPolicy next = *this;
            next.count_ = count_ - 1;
            return RetryDecision{.next_ = next, .delay_ = milliseconds(0)};
        }
        return fallback_decision(*this);
    }
}  // namespace ghclient::retry
