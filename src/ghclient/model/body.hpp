#ifndef GHCLIENT_BODY_HPP
#define GHCLIENT_BODY_HPP

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ghclient::model {
    // Pull-based chunked message body. next_chunk() returns std::nullopt once
    // the stream is exhausted; it may throw if producing a chunk fails.
    class Body {
       public:
        Body() = default;
        virtual ~Body() = default;
        Body(const Body&) = delete;
        Body& operator=(const Body&) = delete;
        Body(Body&&) = delete;
        Body& operator=(Body&&) = delete;

        virtual std::optional<std::string> next_chunk() = 0;
        [[nodiscard]] virtual bool is_end_stream() const = 0;
        [[nodiscard]] virtual std::optional<size_t> size_hint() const { return std::nullopt; }
    };

    class ChunkedBody : public Body {
       public:
        ChunkedBody() = default;
        explicit ChunkedBody(std::vector<std::string> chunks);

        std::optional<std::string> next_chunk() override;
        [[nodiscard]] bool is_end_stream() const override { return chunks_.empty(); }
        [[nodiscard]] std::optional<size_t> size_hint() const override { return remaining_; }

       private:
        std::deque<std::string> chunks_;
        size_t remaining_ = 0;
    };

    std::unique_ptr<Body> make_body(std::string bytes);

    std::unique_ptr<Body> make_chunked_body(std::vector<std::string> chunks);

    // Drains the body. A null body reads as empty.
    std::string read_to_string(Body* body);
}  // namespace ghclient::model

#endif
