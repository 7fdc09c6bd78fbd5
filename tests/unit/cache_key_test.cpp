#include "ghclient/cache/cache_key.hpp"

#include <gtest/gtest.h>

using namespace ghclient;
using cache::CacheKey;

TEST(CacheKeyTest, PrefersETag) {
    model::HeaderMap headers{{"Last-Modified", "Wed, 21 Oct 2015 07:28:00 GMT"}, {"ETag", "W/\"v1\""}};

    auto key = CacheKey::extract_from_headers(headers);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->kind_, CacheKey::Kind::ETAG);
    EXPECT_EQ(key->value_, "W/\"v1\"");
    EXPECT_STREQ(key->conditional_header(), "If-None-Match");
}

TEST(CacheKeyTest, FallsBackToLastModified) {
    model::HeaderMap headers{{"last-modified", "Wed, 21 Oct 2015 07:28:00 GMT"}};

    auto key = CacheKey::extract_from_headers(headers);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->kind_, CacheKey::Kind::LAST_MODIFIED);
    EXPECT_STREQ(key->conditional_header(), "If-Modified-Since");
}

TEST(CacheKeyTest, NoValidator) {
    EXPECT_FALSE(CacheKey::extract_from_headers(model::HeaderMap{{"Content-Type", "application/json"}}).has_value());
    EXPECT_FALSE(CacheKey::extract_from_headers(model::HeaderMap{{"ETag", ""}}).has_value());
}
