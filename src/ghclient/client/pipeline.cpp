#include "pipeline.hpp"

#include <stdexcept>

namespace ghclient::client {
    class Pipeline::Next : public IHttpClient {
       public:
        Next(Pipeline& pipeline, size_t index) : pipeline_(pipeline), index_(index) {}

        model::Response send(model::Request req) override { return pipeline_.dispatch(index_, std::move(req)); }

       private:
        Pipeline& pipeline_;
        size_t index_;
    };

    Pipeline::Pipeline(std::vector<std::unique_ptr<IMiddleware>> layers, std::unique_ptr<IHttpClient> transport)
        : layers_(std::move(layers)), transport_(std::move(transport)) {
        if (transport_ == nullptr) {
            throw std::invalid_argument("Pipeline requires a transport");
        }
        for (const auto& layer : layers_) {
            if (layer == nullptr) {
                throw std::invalid_argument("Pipeline layer must not be null");
            }
        }
    }

    model::Response Pipeline::send(model::Request req) { return dispatch(0, std::move(req)); }

    model::Response Pipeline::dispatch(size_t index, model::Request req) {
        if (index == layers_.size()) {
            return transport_->send(std::move(req));
        }
        Next next(*this, index + 1);
        return layers_[index]->handle(std::move(req), next);
    }
}  // namespace ghclient::client
