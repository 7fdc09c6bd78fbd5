#include "ghclient/pagination/link_header.hpp"

#include <gtest/gtest.h>

#include "ghclient/error/errors.hpp"

using namespace ghclient;
using namespace ghclient::pagination;

TEST(LinkHeaderTest, ParsesAllFourRelations) {
    model::HeaderMap headers{{"Link",
                              "<https://api.github.com/u1>; rel=\"first\", <https://api.github.com/u2>; rel=\"prev\", "
                              "<https://api.github.com/u4>; rel=\"next\", <https://api.github.com/u5>; rel=\"last\""}};

    HeaderLinks links = get_links(headers);

    ASSERT_TRUE(links.first_ && links.prev_ && links.next_ && links.last_);
    EXPECT_EQ(links.first_->str(), "https://api.github.com/u1");
    EXPECT_EQ(links.prev_->str(), "https://api.github.com/u2");
    EXPECT_EQ(links.next_->str(), "https://api.github.com/u4");
    EXPECT_EQ(links.last_->str(), "https://api.github.com/u5");
}

TEST(LinkHeaderTest, PartialLinks) {
    HeaderLinks links = parse_link_header(
        "<https://api.github.com/repositories/1234/releases?page=2>; rel=\"next\", "
        "<https://api.github.com/repositories/1234/releases?page=4>; rel=\"last\"");

    EXPECT_FALSE(links.first_.has_value());
    EXPECT_FALSE(links.prev_.has_value());
    ASSERT_TRUE(links.next_.has_value());
    EXPECT_EQ(links.next_->str(), "https://api.github.com/repositories/1234/releases?page=2");
    ASSERT_TRUE(links.last_.has_value());
    EXPECT_EQ(links.last_->query_param("page"), "4");
}

TEST(LinkHeaderTest, NoLinkHeader) {
    HeaderLinks links = get_links(model::HeaderMap{});

    EXPECT_FALSE(links.first_ || links.prev_ || links.next_ || links.last_);
}

TEST(LinkHeaderTest, UnknownRelIsIgnored) {
    HeaderLinks links = parse_link_header(
        "<https://api.github.com/hub>; rel=\"hub\", <https://api.github.com/x?page=3>; rel=\"next\"");

    ASSERT_TRUE(links.next_.has_value());
    EXPECT_EQ(links.next_->str(), "https://api.github.com/x?page=3");
    EXPECT_FALSE(links.first_.has_value());
}

TEST(LinkHeaderTest, UrlsMayContainCommasAndExtraParams) {
    HeaderLinks links = parse_link_header(
        "<https://api.github.com/search?q=a,b&page=2>; type=\"text/html\"; rel=next, "
        "<https://api.github.com/search?q=a,b&page=9>;rel=\"last\"");

    ASSERT_TRUE(links.next_.has_value());
    EXPECT_EQ(links.next_->query_param("q"), "a,b");
    ASSERT_TRUE(links.last_.has_value());
    EXPECT_EQ(links.last_->query_param("page"), "9");
}

TEST(LinkHeaderTest, MultipleRelNamesOnOneLink) {
    HeaderLinks links = parse_link_header("<https://api.github.com/x?page=1>; rel=\"first prev\"");

    ASSERT_TRUE(links.first_.has_value());
    ASSERT_TRUE(links.prev_.has_value());
    EXPECT_EQ(links.first_->str(), links.prev_->str());
}

TEST(LinkHeaderTest, RelativeUrlIsUriError) {
    EXPECT_THROW(parse_link_header("</repos?page=2>; rel=\"next\""), error::UriError);
}
