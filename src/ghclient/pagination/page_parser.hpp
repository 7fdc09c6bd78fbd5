#ifndef GHCLIENT_PAGE_PARSER_HPP
#define GHCLIENT_PAGE_PARSER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../json/json_decode.hpp"

namespace ghclient::pagination {
    struct PageEnvelope {
        json::Element items_;
        std::optional<bool> incomplete_results_;
        std::optional<uint64_t> total_count_;
    };

    // Finds the item array of a paginated body: the body itself when it is an
    // array, otherwise the first known container attribute of the top-level
    // object. The attribute list is open; endpoints with other shapes add
    // theirs through add_attribute().
    class PageParser {
       public:
        PageParser();
        explicit PageParser(std::vector<std::string> attributes);

        static const std::vector<std::string>& default_attributes();

        // Appended after the existing names; duplicates are ignored.
        void add_attribute(std::string name);

        [[nodiscard]] const std::vector<std::string>& attributes() const { return attributes_; }

        // Throws error::DecodeError when no attribute matches or the matched
        // value is not an array.
        [[nodiscard]] PageEnvelope locate(const json::Document& doc) const;

       private:
        std::vector<std::string> attributes_;
    };
}  // namespace ghclient::pagination

#endif
