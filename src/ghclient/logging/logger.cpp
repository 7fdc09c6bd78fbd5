#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

#include "../utils/constants.hpp"

namespace ghclient::logging {
    std::shared_ptr<spdlog::logger> logger() {
        static std::mutex init_mutex;
        static std::shared_ptr<spdlog::logger> instance;

        std::lock_guard<std::mutex> lock(init_mutex);
        if (instance == nullptr) {
            instance = spdlog::get(constants::LOGGER_NAME);
            if (instance == nullptr) {
                instance = spdlog::stdout_color_mt(constants::LOGGER_NAME);
                instance->set_level(spdlog::level::warn);
            }
        }
        return instance;
    }

    void set_level(std::string_view level) { logger()->set_level(spdlog::level::from_str(std::string(level))); }
}  // namespace ghclient::logging
