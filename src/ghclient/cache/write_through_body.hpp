#ifndef GHCLIENT_WRITE_THROUGH_BODY_HPP
#define GHCLIENT_WRITE_THROUGH_BODY_HPP

#include <memory>
#include <optional>
#include <string>

#include "../model/body.hpp"
#include "cache_storage.hpp"

namespace ghclient::cache {
    // Forwards every chunk of `inner` unchanged and feeds the same bytes to
    // `writer`. The writer is committed once the inner body reports end of
    // stream; a body dropped early, or one whose inner read throws, is never
    // committed. Writer failures are logged and stop further writes, but never
    // reach the reader.
    class WriteToCacheBody : public model::Body {
       public:
        WriteToCacheBody(std::unique_ptr<model::Body> inner, std::unique_ptr<ICacheWriter> writer);

        std::optional<std::string> next_chunk() override;
        [[nodiscard]] bool is_end_stream() const override { return inner_->is_end_stream(); }
        [[nodiscard]] std::optional<size_t> size_hint() const override { return inner_->size_hint(); }

       private:
        void feed(const std::string &chunk);
        void finish();

        std::unique_ptr<model::Body> inner_;
        std::unique_ptr<ICacheWriter> writer_;
        bool committed_ = false;
    };
}  // namespace ghclient::cache

#endif
