#include "json_decode.hpp"

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace ghclient::json {
    Document::Document(std::string_view bytes) : preview_(string_utils::preview(bytes, constants::BODY_PREVIEW_LENGTH)) {
        auto code = parser_.parse(bytes.data(), bytes.size()).get(root_);
        if (code != simdjson::SUCCESS) {
            throw error::DecodeError(preview_, "Failed to parse JSON response: " + std::string(simdjson::error_message(code)));
        }
    }
}  // namespace ghclient::json
