#ifndef GHCLIENT_RETRY_POLICY_HPP
#define GHCLIENT_RETRY_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <optional>

#include "../model/model.hpp"

namespace ghclient::retry {
    struct RetryDecision;

    // Per-call retry state. A decision never mutates the policy it was taken
    // from; it returns the state to use for the following attempt.
    struct RetryPolicy {
        enum class Mode { NONE, COUNT, BACKOFF };

        Mode mode_ = Mode::NONE;
        std::size_t count_ = 0;
        std::chrono::milliseconds fallback_delay_{0};
        std::chrono::milliseconds max_delay_{0};

        static RetryPolicy none();
        // Retries immediately, up to `count` times.
        static RetryPolicy simple(std::size_t count);
        // Honours Retry-After / X-RateLimit-Reset, otherwise waits `fallback`
        // and doubles it for the next attempt. Every delay is clamped to `max`.
        static RetryPolicy backoff(std::chrono::milliseconds fallback, std::chrono::milliseconds max, std::size_t count);

        // std::nullopt when `resp` is final.
        [[nodiscard]] std::optional<RetryDecision> retry(const model::Response &resp, std::chrono::system_clock::time_point now) const;

        // Decision after a transport failure that produced no response.
        [[nodiscard]] std::optional<RetryDecision> retry_after_error() const;

        [[nodiscard]] bool exhausted() const { return mode_ == Mode::NONE || count_ == 0; }

        bool operator==(const RetryPolicy &other) const = default;
    };

    struct RetryDecision {
        RetryPolicy next_;
        std::chrono::milliseconds delay_{0};
    };

    // Delay requested by the server: Retry-After (seconds, possibly
    // fractional), else X-RateLimit-Reset (epoch seconds) minus `now`, floored at zero.
    std::optional<std::chrono::milliseconds> delay_from_headers(const model::HeaderMap &headers, std::chrono::system_clock::time_point now);

    // 5xx, 429, or a 400 carrying a rate-limit delay.
    bool is_retryable(const model::Response &resp, std::chrono::system_clock::time_point now);
}  // namespace ghclient::retry

#endif
