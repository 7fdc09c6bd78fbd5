#ifndef GHCLIENT_CONSTANTS_HPP
#define GHCLIENT_CONSTANTS_HPP

#include <cstddef>

namespace ghclient::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr long MILLISECONDS_PER_SECOND = 1000L;
    inline constexpr std::size_t BODY_PREVIEW_LENGTH = 512;
    inline constexpr const char* LOGGER_NAME = "ghclient";
    inline constexpr const char* DEFAULT_BASE_URL = "https://api.github.com";
    inline constexpr const char* DEFAULT_USER_AGENT = "ghclient/1.0";
    inline constexpr const char* JSON_ACCEPT = "application/vnd.github+json";
}  // namespace ghclient::constants

#endif
