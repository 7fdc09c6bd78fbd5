#ifndef GHCLIENT_JSON_DECODE_HPP
#define GHCLIENT_JSON_DECODE_HPP

#include <simdjson.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "../error/errors.hpp"

namespace ghclient::json {
    using Element = simdjson::dom::element;

    template <typename T>
    using ItemDecoder = std::function<T(Element)>;

    // Parsed JSON text. Elements obtained from root() are only valid while the
    // document is alive.
    class Document {
       public:
        // Throws error::DecodeError for malformed JSON.
        explicit Document(std::string_view bytes);

        Document(const Document&) = delete;
        Document& operator=(const Document&) = delete;
        Document(Document&&) = delete;
        Document& operator=(Document&&) = delete;
        ~Document() = default;

        [[nodiscard]] Element root() const { return root_; }
        [[nodiscard]] const std::string& preview() const { return preview_; }

       private:
        simdjson::dom::parser parser_;
        Element root_;
        std::string preview_;
    };

    // Strings decode to their value, any other JSON value of a std::string
    // target decodes to its minified text. Class types provide
    // `static T from_json(json::Element)`.
    template <typename T>
    T from_element(Element e) {
        if constexpr (std::is_same_v<T, std::string>) {
            std::string_view sv;
            if (e.get_string().get(sv) == simdjson::SUCCESS) {
                return std::string(sv);
            }
            return simdjson::minify(e);
        } else if constexpr (std::is_same_v<T, bool>) {
            return bool(e);
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(double(e));
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            return static_cast<T>(int64_t(e));
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<T>(uint64_t(e));
        } else {
            return T::from_json(e);
        }
    }

    template <typename T>
    ItemDecoder<T> default_decoder() {
        return [](Element e) { return from_element<T>(e); };
    }

    // Runs `fn`, reporting simdjson failures as error::DecodeError.
    template <typename Fn>
    auto guarded(const Document& doc, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const simdjson::simdjson_error& e) {
            throw error::DecodeError(doc.preview(), "Failed to decode JSON response: " + std::string(e.what()));
        }
    }

    template <typename T>
    std::vector<T> decode_array(const Document& doc, Element array, const ItemDecoder<T>& decode) {
        return guarded(doc, [&]() {
            std::vector<T> out;
            simdjson::dom::array items = array.get_array();
            out.reserve(items.size());
            for (Element item : items) {
                out.push_back(decode(item));
            }
            return out;
        });
    }

    template <typename T>
    T decode_document(std::string_view bytes, const ItemDecoder<T>& decode) {
        Document doc(bytes);
        return guarded(doc, [&]() { return decode(doc.root()); });
    }
}  // namespace ghclient::json

#endif
