#ifndef GHCLIENT_DELAY_HPP
#define GHCLIENT_DELAY_HPP

#include <chrono>
#include <stop_token>

namespace ghclient::retry {
    // Sleep used between retry attempts.
    class IDelay {
       public:
        IDelay() = default;
        virtual ~IDelay() = default;
        IDelay(const IDelay &) = delete;
        IDelay &operator=(const IDelay &) = delete;
        IDelay(IDelay &&) = delete;
        IDelay &operator=(IDelay &&) = delete;

        // Blocks for `duration`. Throws error::CancelledError if `stop` is
        // requested before or during the wait.
        virtual void wait(std::chrono::milliseconds duration, std::stop_token stop) = 0;
    };

    class ThreadDelay : public IDelay {
       public:
        void wait(std::chrono::milliseconds duration, std::stop_token stop) override;
    };
}  // namespace ghclient::retry

#endif
