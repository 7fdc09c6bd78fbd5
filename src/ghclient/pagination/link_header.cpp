#include "link_header.hpp"

#include <string>

#include "../logging/logger.hpp"
#include "../utils/string_utils.hpp"

namespace ghclient::pagination {
    struct LinkRel {
        static constexpr const char* FIRST = "first";
        static constexpr const char* PREV = "prev";
        static constexpr const char* NEXT = "next";
        static constexpr const char* LAST = "last";
    };

    static std::string_view unquote(std::string_view v) {
        v = string_utils::trim_view(v);
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
            v = v.substr(1, v.size() - 2);
        }
        return v;
    }

    static void assign(HeaderLinks& links, std::string_view rel, const std::string& target) {
        if (rel == LinkRel::FIRST) {
            links.first_ = url::Url::parse(target);
        } else if (rel == LinkRel::PREV) {
            links.prev_ = url::Url::parse(target);
        } else if (rel == LinkRel::NEXT) {
            links.next_ = url::Url::parse(target);
        } else if (rel == LinkRel::LAST) {
            links.last_ = url::Url::parse(target);
        } else {
            logging::logger()->debug("pagination: ignoring Link rel \"{}\" for {}", rel, target);
        }
    }

    // Walks "param; param" after the closing '>' up to the next '<'.
    static void apply_params(HeaderLinks& links, std::string_view params, const std::string& target) {
        size_t pos = 0;
        while (pos <= params.size()) {
            size_t end = params.find(';', pos);
            if (end == std::string_view::npos) {
                end = params.size();
            }
            std::string_view param = string_utils::trim_view(params.substr(pos, end - pos));
            while (!param.empty() && param.back() == ',') {
                param.remove_suffix(1);
            }

            auto eq = param.find('=');
            if (eq != std::string_view::npos && string_utils::ieq(string_utils::trim_view(param.substr(0, eq)), "rel")) {
                // rel may hold several space separated names.
                std::string_view rels = unquote(param.substr(eq + 1));
                size_t rpos = 0;
                while (rpos < rels.size()) {
                    size_t rend = rels.find(' ', rpos);
                    if (rend == std::string_view::npos) {
                        rend = rels.size();
                    }
                    if (rend > rpos) {
                        assign(links, rels.substr(rpos, rend - rpos), target);
                    }
                    rpos = rend + 1;
                }
            }
            pos = end + 1;
        }
    }

    HeaderLinks parse_link_header(std::string_view value) {
        HeaderLinks links;
        size_t pos = 0;
        while (true) {
            size_t open = value.find('<', pos);
            if (open == std::string_view::npos) {
                break;
            }
            size_t close = value.find('>', open + 1);
            if (close == std::string_view::npos) {
                break;
            }
            const std::string target(string_utils::trim_view(value.substr(open + 1, close - open - 1)));

            size_t next_open = value.find('<', close + 1);
            std::string_view params =
                value.substr(close + 1, next_open == std::string_view::npos ? std::string_view::npos : next_open - close - 1);
            apply_params(links, params, target);

            if (next_open == std::string_view::npos) {
                break;
            }
            pos = next_open;
        }
        return links;
    }

    HeaderLinks get_links(const model::HeaderMap& headers) {
        HeaderLinks links;
        for (const std::string& value : headers.get_all(model::HeaderKeys::LINK)) {
            HeaderLinks parsed = parse_link_header(value);
            if (parsed.first_) {
                links.first_ = std::move(parsed.first_);
            }
            if (parsed.prev_) {
                links.prev_ = std::move(parsed.prev_);
            }
            if (parsed.next_) {
                links.next_ = std::move(parsed.next_);
            }
            if (parsed.last_) {
                links.last_ = std::move(parsed.last_);
            }
        }
        return links;
    }
}  // namespace ghclient::pagination
