#ifndef GHCLIENT_PIPELINE_HPP
#define GHCLIENT_PIPELINE_HPP

#include <memory>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

namespace ghclient::client {
    // Ordered middleware stack around a terminal transport. layers[0] sees the
    // request first and the response last.
    class Pipeline : public IHttpClient {
       public:
        Pipeline(std::vector<std::unique_ptr<IMiddleware>> layers, std::unique_ptr<IHttpClient> transport);

        model::Response send(model::Request req) override;

        [[nodiscard]] size_t depth() const { return layers_.size(); }

       private:
        class Next;

        model::Response dispatch(size_t index, model::Request req);

        std::vector<std::unique_ptr<IMiddleware>> layers_;
        std::unique_ptr<IHttpClient> transport_;
    };
}  // namespace ghclient::client

#endif
