#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "ghclient/client/auth_header.hpp"
#include "ghclient/client/base_uri.hpp"
#include "ghclient/client/pipeline.hpp"
#include "mocks/scripted_transport.hpp"

using namespace ghclient;
using namespace ghclient::tests;

class AuthBaseUriTest : public ::testing::Test {
protected:
    void build(const std::string &base_url) {
        const url::Url base = url::Url::parse(base_url);
        std::vector<std::unique_ptr<client::IMiddleware>> layers;
        layers.push_back(std::make_unique<client::BaseUriLayer>(base));
        layers.push_back(std::make_unique<client::AuthHeaderLayer>(client::AuthHeaderLayer::bearer("t0ken"), base));
        pipeline = std::make_unique<client::Pipeline>(std::move(layers), std::make_unique<SharedTransport>(transport));
    }

    model::Request sent(model::Request req) {
        transport->reply(200);
        (void)pipeline->send(std::move(req));
        return transport->requests().back();
    }

    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    std::unique_ptr<client::Pipeline> pipeline;
};

TEST_F(AuthBaseUriTest, RelativePathIsResolvedAndAuthorized) {
    build("https://api.github.com");

    auto req = sent(model::make_get("/repos/o/r/releases?page=2"));

    EXPECT_EQ(req.url_, "https://api.github.com/repos/o/r/releases?page=2");
    EXPECT_EQ(req.headers_.get("Authorization"), "Bearer t0ken");
}

TEST_F(AuthBaseUriTest, BasePathIsPreserved) {
    build("https://ghe.example.com/api/v3/");

    auto req = sent(model::make_get("/user/repos"));

    EXPECT_EQ(req.url_, "https://ghe.example.com/api/v3/user/repos");
    EXPECT_TRUE(req.headers_.contains("Authorization"));
}

TEST_F(AuthBaseUriTest, AbsoluteUrlOnApiHostIsAuthorized) {
    build("https://api.github.com");

    auto req = sent(model::make_get("https://api.github.com/repositories/1/issues?page=3"));

    EXPECT_EQ(req.url_, "https://api.github.com/repositories/1/issues?page=3");
    EXPECT_EQ(req.headers_.get("Authorization"), "Bearer t0ken");
}

TEST_F(AuthBaseUriTest, OtherHostsNeverGetCredentials) {
    build("https://api.github.com");

    auto req = sent(model::make_get("https://objects.githubusercontent.com/download/1"));

    EXPECT_FALSE(req.headers_.contains("Authorization"));
}

TEST_F(AuthBaseUriTest, DifferentPortIsAnotherAuthority) {
    build("https://api.github.com");

    auto req = sent(model::make_get("https://api.github.com:8443/x"));

    EXPECT_FALSE(req.headers_.contains("Authorization"));
}

TEST_F(AuthBaseUriTest, ExistingAuthorizationIsKept) {
    build("https://api.github.com");
    auto req = model::make_get("/user");
    req.headers_.set("Authorization", "token other");

    EXPECT_EQ(sent(std::move(req)).headers_.get("Authorization"), "token other");
}
