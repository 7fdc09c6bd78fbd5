#ifndef GHCLIENT_STRING_UTILS_HPP
#define GHCLIENT_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace ghclient::string_utils {
    bool ieq(std::string_view a, std::string_view b);

    std::string trim(std::string s);

    std::string_view trim_view(std::string_view sv);

    std::string to_lower(std::string s);

    // Strict base-10 parse of the whole (trimmed) string.
    std::optional<long long> parse_long(std::string_view sv);

    std::optional<double> parse_double(std::string_view sv);

    std::string preview(std::string_view body, std::size_t max_length);
}  // namespace ghclient::string_utils

#endif
