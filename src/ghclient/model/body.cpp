#include "body.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ghclient::model {
    ChunkedBody::ChunkedBody(std::vector<std::string> chunks) {
        for (auto& chunk : chunks) {
            if (chunk.empty()) {
                continue;
            }
            remaining_ += chunk.size();
            chunks_.push_back(std::move(chunk));
        }
    }

    std::optional<std::string> ChunkedBody::next_chunk() {
        if (chunks_.empty()) {
            return std::nullopt;
        }
        std::string chunk = std::move(chunks_.front());
        chunks_.pop_front();
        remaining_ -= chunk.size();
        return chunk;
    }

    std::unique_ptr<Body> make_body(std::string bytes) {
        std::vector<std::string> chunks;
        chunks.push_back(std::move(bytes));
        return std::make_unique<ChunkedBody>(std::move(chunks));
    }

    std::unique_ptr<Body> make_chunked_body(std::vector<std::string> chunks) { return std::make_unique<ChunkedBody>(std::move(chunks)); }

    std::string read_to_string(Body* body) {
        std::string out;
        if (body == nullptr) {
            return out;
        }
        if (auto hint = body->size_hint()) {
            out.reserve(*hint);
        }
        while (auto chunk = body->next_chunk()) {
            out += *chunk;
        }
        return out;
    }
}  // namespace ghclient::model
