#include "write_through_body.hpp"

#include <exception>
#include <stdexcept>

#include "../logging/logger.hpp"

namespace ghclient::cache {
    WriteToCacheBody::WriteToCacheBody(std::unique_ptr<model::Body> inner, std::unique_ptr<ICacheWriter> writer)
        : inner_(std::move(inner)), writer_(std::move(writer)) {
        if (inner_ == nullptr) {
            inner_ = model::make_body("");
        }
        // An empty body is complete before the first read.
        if (inner_->is_end_stream()) {
            finish();
        }
    }

    std::optional<std::string> WriteToCacheBody::next_chunk() {
        auto chunk = inner_->next_chunk();
        if (!chunk) {
            finish();
            return chunk;
        }
        feed(*chunk);
        if (inner_->is_end_stream()) {
            finish();
        }
        return chunk;
    }

    void WriteToCacheBody::feed(const std::string &chunk) {
        if (writer_ == nullptr) {
            return;
        }
        try {
            writer_->write_body(chunk);
        } catch (const std::exception &e) {
            logging::logger()->warn("cache write failed, response will not be cached: {}", e.what());
            writer_.reset();
        }
    }

    void WriteToCacheBody::finish() {
        if (committed_ || writer_ == nullptr) {
            return;
        }
        committed_ = true;
        try {
            writer_->commit();
        } catch (const std::exception &e) {
            logging::logger()->warn("cache commit failed: {}", e.what());
        }
        writer_.reset();
    }
}  // namespace ghclient::cache
