#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#include "constants.hpp"

namespace ghclient::string_utils {
    bool ieq(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string_view trim_view(std::string_view sv) {
        const auto first = sv.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = sv.find_last_not_of(" \t\r\n");
        return sv.substr(first, last - first + 1);
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::optional<long long> parse_long(std::string_view sv) {
        const std::string tmp(trim_view(sv));
        if (tmp.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const long long v = std::strtoll(tmp.c_str(), &end, constants::BASE_10);
        if (end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return v;
    }

    std::optional<double> parse_double(std::string_view sv) {
        const std::string tmp(trim_view(sv));
        if (tmp.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double v = std::strtod(tmp.c_str(), &end);
        if (end == nullptr || *end != '\0' || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    }

    std::string preview(std::string_view body, std::size_t max_length) { return std::string(body.substr(0, max_length)); }
}  // namespace ghclient::string_utils
