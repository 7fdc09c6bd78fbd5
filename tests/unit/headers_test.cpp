#include "ghclient/model/headers.hpp"

#include <gtest/gtest.h>

#include <string>

#include "ghclient/error/errors.hpp"
#include "ghclient/model/model.hpp"

using namespace ghclient;
using namespace ghclient::model;

TEST(HeaderMapTest, LookupIsCaseInsensitive) {
    HeaderMap headers{{"ETag", "\"abc\""}, {"content-type", "application/json"}};

    EXPECT_EQ(headers.get("etag"), "\"abc\"");
    EXPECT_EQ(headers.get(HeaderKeys::CONTENT_TYPE), "application/json");
    EXPECT_TRUE(headers.contains("ETAG"));
    EXPECT_FALSE(headers.get(HeaderKeys::LINK).has_value());
}

TEST(HeaderMapTest, SetReplacesEveryFieldWithTheName) {
    HeaderMap headers;
    headers.append("Link", "<a>; rel=\"next\"");
    headers.append("link", "<b>; rel=\"last\"");
    headers.append("Accept", "*/*");

    headers.set("LINK", "<c>; rel=\"first\"");

    EXPECT_EQ(headers.get_all("Link"), std::vector<std::string>{"<c>; rel=\"first\""});
    EXPECT_EQ(headers.size(), 2U);
}

TEST(HeaderMapTest, RemoveReportsCount) {
    HeaderMap headers{{"X-A", "1"}, {"x-a", "2"}, {"X-B", "3"}};

    EXPECT_EQ(headers.remove("X-A"), 2U);
    EXPECT_EQ(headers.remove("X-A"), 0U);
    EXPECT_EQ(headers.size(), 1U);
}

TEST(HeaderMapTest, ParseLineTrimsNameAndValue) {
    auto field = HeaderMap::parse_line("Retry-After:  5 \r\n");
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(field->first, "Retry-After");
    EXPECT_EQ(field->second, "5");

    // Values may contain colons.
    auto link = HeaderMap::parse_line("Link: <https://api.github.com/x?page=2>; rel=\"next\"");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->second, "<https://api.github.com/x?page=2>; rel=\"next\"");
}

TEST(HeaderMapTest, ParseLineRejectsStatusAndBlankLines) {
    EXPECT_FALSE(HeaderMap::parse_line("HTTP/1.1 200 OK\r\n").has_value());
    EXPECT_FALSE(HeaderMap::parse_line("\r\n").has_value());
    EXPECT_FALSE(HeaderMap::parse_line(": value").has_value());
}

TEST(ModelTest, CloneRequestCopiesEverything) {
    Request req = make_get("https://api.github.com/repos/o/r");
    req.method_ = "POST";
    req.body_ = "{\"a\":1}";
    req.headers_.set("X-Custom", "yes");

    auto copy = clone_request(req);
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(copy->method_, "POST");
    EXPECT_EQ(copy->url_, req.url_);
    EXPECT_EQ(copy->body_, req.body_);
    EXPECT_EQ(copy->headers_, req.headers_);
}

TEST(ModelTest, CloneRequestRefusesStreamingBody) {
    Request req = make_get("https://api.github.com/upload");
    req.body_stream_ = make_body("payload");

    EXPECT_FALSE(clone_request(req).has_value());
}

TEST(ModelTest, EnsureSuccessRaisesHttpErrorWithPreview) {
    Response resp;
    resp.status_ = 404;
    resp.effective_url_ = "https://api.github.com/missing";
    resp.body_ = make_body("{\"message\":\"Not Found\"}");

    try {
        ensure_success(resp);
        FAIL() << "expected HttpError";
    } catch (const error::HttpError &e) {
        EXPECT_EQ(e.status_, 404);
        EXPECT_EQ(e.url_, "https://api.github.com/missing");
        EXPECT_EQ(e.body_preview_, "{\"message\":\"Not Found\"}");
    }
}

TEST(ModelTest, ResponseTextDrainsChunks) {
    Response resp;
    resp.body_ = make_chunked_body({"ab", "", "cd"});

    EXPECT_EQ(resp.text(), "abcd");
    EXPECT_EQ(resp.text(), "");
}
