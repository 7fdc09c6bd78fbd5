#include "ghclient/client/pipeline.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "mocks/mock_http_client.hpp"
#include "mocks/scripted_transport.hpp"

using namespace ghclient;
using namespace ghclient::tests;
using namespace testing;

namespace {
    // Tags the request on the way in and the response on the way out.
    class TagLayer : public client::IMiddleware {
    public:
        TagLayer(std::string tag, std::vector<std::string> &trace) : tag_(std::move(tag)), trace_(trace) {}

        model::Response handle(model::Request req, client::IHttpClient &next) override {
            trace_.push_back("in:" + tag_);
            req.headers_.append("X-Layer", tag_);
            model::Response resp = next.send(std::move(req));
            trace_.push_back("out:" + tag_);
            return resp;
        }

    private:
        std::string tag_;
        std::vector<std::string> &trace_;
    };
}  // namespace

TEST(PipelineTest, LayersRunInOrderAroundTransport) {
    std::vector<std::string> trace;
    auto transport = std::make_shared<ScriptedTransport>();
    transport->reply(200);

    std::vector<std::unique_ptr<client::IMiddleware>> layers;
    layers.push_back(std::make_unique<TagLayer>("outer", trace));
    layers.push_back(std::make_unique<TagLayer>("inner", trace));
    client::Pipeline pipeline(std::move(layers), std::make_unique<SharedTransport>(transport));

    EXPECT_EQ(pipeline.depth(), 2U);
    EXPECT_EQ(pipeline.send(model::make_get("https://api.github.com/")).status_, 200);

    EXPECT_EQ(trace, (std::vector<std::string>{"in:outer", "in:inner", "out:inner", "out:outer"}));
    EXPECT_EQ(transport->requests()[0].headers_.get_all("X-Layer"), (std::vector<std::string>{"outer", "inner"}));
}

TEST(PipelineTest, EmptyPipelineCallsTransport) {
    auto transport = std::make_unique<StrictMock<MockHttpClient>>();
    EXPECT_CALL(*transport, send(_)).WillOnce([](model::Request) { return make_response(204); });

    client::Pipeline pipeline({}, std::move(transport));

    EXPECT_EQ(pipeline.send(model::make_get("https://api.github.com/")).status_, 204);
}

TEST(PipelineTest, MiddlewareMayShortCircuit) {
    auto layer = std::make_unique<StrictMock<MockMiddleware>>();
    EXPECT_CALL(*layer, handle(_, _)).WillOnce([](model::Request, client::IHttpClient &) { return make_response(418); });
    auto transport = std::make_unique<StrictMock<MockHttpClient>>();

    std::vector<std::unique_ptr<client::IMiddleware>> layers;
    layers.push_back(std::move(layer));
    client::Pipeline pipeline(std::move(layers), std::move(transport));

    EXPECT_EQ(pipeline.send(model::make_get("https://api.github.com/")).status_, 418);
}

TEST(PipelineTest, RejectsNullParts) {
    EXPECT_THROW(client::Pipeline({}, nullptr), std::invalid_argument);

    std::vector<std::unique_ptr<client::IMiddleware>> layers;
    layers.push_back(nullptr);
    EXPECT_THROW(client::Pipeline(std::move(layers), std::make_unique<ScriptedTransport>()), std::invalid_argument);
}
