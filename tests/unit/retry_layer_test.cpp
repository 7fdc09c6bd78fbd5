#include "ghclient/retry/retry_layer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <vector>

#include "ghclient/client/pipeline.hpp"
#include "ghclient/error/errors.hpp"
#include "mocks/mock_http_client.hpp"
#include "mocks/recording_delay.hpp"
#include "mocks/scripted_transport.hpp"

using namespace ghclient;
using namespace ghclient::tests;
using namespace testing;
using namespace std::chrono_literals;
using retry::RetryPolicy;

namespace {
    const char *URI = "https://api.github.com/repos/o/r";
    const auto NOW = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
}  // namespace

class RetryLayerTest : public Test {
protected:
    void build(RetryPolicy policy) {
        transport = std::make_shared<ScriptedTransport>();
        delay = std::make_shared<RecordingDelay>();
        std::vector<std::unique_ptr<client::IMiddleware>> layers;
        layers.push_back(std::make_unique<retry::RetryLayer>(policy, delay, [] { return NOW; }));
        pipeline = std::make_unique<client::Pipeline>(std::move(layers), std::make_unique<SharedTransport>(transport));
    }

    std::shared_ptr<ScriptedTransport> transport;
    std::shared_ptr<RecordingDelay> delay;
    std::unique_ptr<client::Pipeline> pipeline;
};

TEST_F(RetryLayerTest, FixedCountRetriesThreeServerErrorsThenSucceeds) {
    build(RetryPolicy::simple(3));
    transport->reply(500).reply(500).reply(500).reply(200, {}, "ok");

    auto resp = pipeline->send(model::make_get(URI));

    EXPECT_EQ(resp.status_, 200);
    EXPECT_EQ(resp.text(), "ok");
    EXPECT_EQ(transport->request_count(), 4U);
    EXPECT_EQ(delay->delays(), (std::vector<std::chrono::milliseconds>{0ms, 0ms, 0ms}));
}

TEST_F(RetryLayerTest, ExhaustedRetriesReturnLastResponseVerbatim) {
    build(RetryPolicy::simple(2));
    transport->reply(503, {}, "first").reply(503, {}, "second").reply(503, model::HeaderMap{{"X-Final", "yes"}}, "third");

    auto resp = pipeline->send(model::make_get(URI));

    EXPECT_EQ(resp.status_, 503);
    EXPECT_EQ(resp.headers_.get("X-Final"), "yes");
    EXPECT_EQ(resp.text(), "third");
    EXPECT_EQ(transport->request_count(), 3U);
}

TEST_F(RetryLayerTest, ZeroCountSendsOnce) {
    build(RetryPolicy::simple(0));
    transport->reply(500);

    EXPECT_EQ(pipeline->send(model::make_get(URI)).status_, 500);
    EXPECT_EQ(transport->request_count(), 1U);
    EXPECT_TRUE(delay->delays().empty());
}

TEST_F(RetryLayerTest, NonRetryableStatusIsFinal) {
    build(RetryPolicy::simple(3));
    transport->reply(404, {}, "{\"message\":\"Not Found\"}");

    EXPECT_EQ(pipeline->send(model::make_get(URI)).status_, 404);
    EXPECT_EQ(transport->request_count(), 1U);
}

TEST_F(RetryLayerTest, BackoffHonoursRetryAfter) {
    build(RetryPolicy::backoff(100ms, 60s, 3));
    transport->reply(429, model::HeaderMap{{"Retry-After", "5"}}).reply(200);

    EXPECT_EQ(pipeline->send(model::make_get(URI)).status_, 200);
    EXPECT_EQ(delay->delays(), (std::vector<std::chrono::milliseconds>{5s}));
}

TEST_F(RetryLayerTest, BackoffDoublesAcrossAttempts) {
    build(RetryPolicy::backoff(100ms, 300ms, 4));
    transport->reply(500).reply(502).reply(503).reply(504).reply(200);

    EXPECT_EQ(pipeline->send(model::make_get(URI)).status_, 200);
    EXPECT_EQ(delay->delays(), (std::vector<std::chrono::milliseconds>{100ms, 200ms, 300ms, 300ms}));
}

TEST_F(RetryLayerTest, TransportErrorsAreRetriedUnderBackoff) {
    build(RetryPolicy::backoff(50ms, 1s, 2));
    transport->fail().reply(200, {}, "ok");

    auto resp = pipeline->send(model::make_get(URI));

    EXPECT_EQ(resp.text(), "ok");
    EXPECT_EQ(delay->delays(), (std::vector<std::chrono::milliseconds>{50ms}));
}

TEST_F(RetryLayerTest, LastTransportErrorIsRethrown) {
    build(RetryPolicy::simple(1));
    transport->fail(7, "first").fail(28, "timed out");

    try {
        (void)pipeline->send(model::make_get(URI));
        FAIL() << "expected TransportError";
    } catch (const error::TransportError &e) {
        EXPECT_EQ(e.code_, 28);
        EXPECT_STREQ(e.what(), "timed out");
    }
    EXPECT_EQ(transport->request_count(), 2U);
}

TEST_F(RetryLayerTest, EveryAttemptReplaysTheFullRequest) {
    build(RetryPolicy::simple(1));
    transport->reply(500).reply(200);

    auto req = model::make_get(URI);
    req.method_ = "PATCH";
    req.body_ = "{\"name\":\"x\"}";
    req.headers_.set("X-Trace", "1");
    (void)pipeline->send(std::move(req));

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2U);
    for (const auto &sent : requests) {
        EXPECT_EQ(sent.method_, "PATCH");
        EXPECT_EQ(sent.url_, URI);
        EXPECT_EQ(sent.body_, "{\"name\":\"x\"}");
        EXPECT_EQ(sent.headers_.get("X-Trace"), "1");
    }
}

TEST_F(RetryLayerTest, StreamingBodyIsSentOnce) {
    build(RetryPolicy::simple(3));
    transport->reply(500);

    auto req = model::make_get(URI);
    req.method_ = "PUT";
    req.body_stream_ = model::make_body("bytes");

    EXPECT_EQ(pipeline->send(std::move(req)).status_, 500);
    EXPECT_EQ(transport->request_count(), 1U);
}

TEST_F(RetryLayerTest, StopDuringDelayCancels) {
    build(RetryPolicy::simple(3));
    transport->reply(500).reply(200);

    std::stop_source stop;
    stop.request_stop();

    EXPECT_THROW((void)pipeline->send(model::make_get(URI, stop.get_token())), error::CancelledError);
    EXPECT_EQ(transport->request_count(), 1U);
}

TEST(RetryLayerMockTest, RetriesAroundInnerClient) {
    StrictMock<MockHttpClient> inner;
    auto delay = std::make_shared<RecordingDelay>();
    retry::RetryLayer layer(RetryPolicy::simple(1), delay, [] { return NOW; });

    EXPECT_CALL(inner, send(Field(&model::Request::url_, URI)))
        .WillOnce([](model::Request) { return make_response(502); })
        .WillOnce([](model::Request) { return make_response(200, {}, "done"); });

    auto resp = layer.handle(model::make_get(URI), inner);
    EXPECT_EQ(resp.text(), "done");
}

TEST(ThreadDelayTest, StopRequestedBeforeWaitThrows) {
    retry::ThreadDelay delay;
    std::stop_source stop;
    stop.request_stop();

    EXPECT_THROW(delay.wait(10s, stop.get_token()), error::CancelledError);
}

TEST(ThreadDelayTest, ZeroDelayReturns) {
    retry::ThreadDelay delay;

    EXPECT_NO_THROW(delay.wait(0ms, {}));
}
