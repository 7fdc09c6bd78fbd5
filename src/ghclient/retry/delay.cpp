#include "delay.hpp"

#include <condition_variable>
#include <mutex>

#include "../error/errors.hpp"

namespace ghclient::retry {
    void ThreadDelay::wait(std::chrono::milliseconds duration, std::stop_token stop) {
        if (stop.stop_requested()) {
            throw error::CancelledError("retry delay");
        }
        if (duration.count() > 0) {
            std::mutex mutex;
            std::condition_variable_any cv;
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, stop, duration, [] { return false; });
        }
        if (stop.stop_requested()) {
            throw error::CancelledError("retry delay");
        }
    }
}  // namespace ghclient::retry
