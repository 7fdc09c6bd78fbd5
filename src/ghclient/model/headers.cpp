#include "headers.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "../utils/string_utils.hpp"

namespace ghclient::model {
    HeaderMap::HeaderMap(std::initializer_list<Field> fields) : fields_(fields) {}

    void HeaderMap::append(std::string name, std::string value) { fields_.emplace_back(std::move(name), std::move(value)); }

    void HeaderMap::set(const std::string& name, std::string value) {
        remove(name);
        fields_.emplace_back(name, std::move(value));
    }

    size_t HeaderMap::remove(std::string_view name) {
        const auto before = fields_.size();
        fields_.erase(std::remove_if(fields_.begin(), fields_.end(), [&](const Field& f) { return string_utils::ieq(f.first, name); }),
                      fields_.end());
        return before - fields_.size();
    }

    std::optional<std::string> HeaderMap::get(std::string_view name) const {
        for (const auto& [field_name, value] : fields_) {
            if (string_utils::ieq(field_name, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> HeaderMap::get_all(std::string_view name) const {
        std::vector<std::string> out;
        for (const auto& [field_name, value] : fields_) {
            if (string_utils::ieq(field_name, name)) {
                out.push_back(value);
            }
        }
        return out;
    }

    bool HeaderMap::contains(std::string_view name) const {
        return std::any_of(fields_.begin(), fields_.end(), [&](const Field& f) { return string_utils::ieq(f.first, name); });
    }

    std::optional<HeaderMap::Field> HeaderMap::parse_line(std::string_view line) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }
        std::string_view name = string_utils::trim_view(line.substr(0, colon));
        if (name.empty()) {
            return std::nullopt;
        }
        return Field{std::string(name), std::string(string_utils::trim_view(line.substr(colon + 1)))};
    }
}  // namespace ghclient::model
