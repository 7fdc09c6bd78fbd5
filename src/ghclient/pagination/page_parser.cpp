#include "page_parser.hpp"

#include <algorithm>

#include "../error/errors.hpp"

namespace ghclient::pagination {
    struct EnvelopeKeys {
        static constexpr const char* INCOMPLETE_RESULTS = "incomplete_results";
        static constexpr const char* TOTAL_COUNT = "total_count";
    };

    PageParser::PageParser() : attributes_(default_attributes()) {}

    PageParser::PageParser(std::vector<std::string> attributes) : attributes_(std::move(attributes)) {}

    const std::vector<std::string>& PageParser::default_attributes() {
        static const std::vector<std::string> attributes = {
            "items", "workflows", "workflow_runs", "jobs", "artifacts", "repositories", "installations", "runners",
        };
        return attributes;
    }

    void PageParser::add_attribute(std::string name) {
        if (name.empty() || std::ranges::find(attributes_, name) != attributes_.end()) {
            return;
        }
        attributes_.push_back(std::move(name));
    }

    PageEnvelope PageParser::locate(const json::Document& doc) const {
        json::Element root = doc.root();
        if (root.is_array()) {
            return PageEnvelope{.items_ = root};
        }

        simdjson::dom::object object;
        if (root.get_object().get(object) != simdjson::SUCCESS) {
            throw error::DecodeError(doc.preview(), "error decoding pagination result, body is neither an array nor an object");
        }

        for (const std::string& attribute : attributes_) {
            json::Element value;
            if (object.at_key(attribute).get(value) != simdjson::SUCCESS) {
                continue;
            }
            if (!value.is_array()) {
                throw error::DecodeError(doc.preview(), "error decoding pagination result, attribute \"" + attribute + "\" is not an array");
            }

            PageEnvelope envelope{.items_ = value};
            bool incomplete = false;
            if (object.at_key(EnvelopeKeys::INCOMPLETE_RESULTS).get_bool().get(incomplete) == simdjson::SUCCESS) {
                envelope.incomplete_results_ = incomplete;
            }
            uint64_t total = 0;
            if (object.at_key(EnvelopeKeys::TOTAL_COUNT).get_uint64().get(total) == simdjson::SUCCESS) {
                envelope.total_count_ = total;
            }
            return envelope;
        }

        throw error::DecodeError(doc.preview(), "error decoding pagination result, top-level attribute unknown");
    }
}  // namespace ghclient::pagination
