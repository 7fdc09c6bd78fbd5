#ifndef GHCLIENT_LOGGER_HPP
#define GHCLIENT_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace ghclient::logging {
    // Shared "ghclient" logger. A logger already registered under that name
    // (e.g. configured by the host application) is reused.
    std::shared_ptr<spdlog::logger> logger();

    // Accepts spdlog level names: trace, debug, info, warning, error, critical, off.
    void set_level(std::string_view level);
}  // namespace ghclient::logging

#endif
