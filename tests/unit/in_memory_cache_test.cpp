#include "ghclient/cache/in_memory_cache.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace ghclient;
using namespace ghclient::cache;

namespace {
    CacheKey etag(const std::string &v) { return CacheKey{.kind_ = CacheKey::Kind::ETAG, .value_ = v}; }
}  // namespace

TEST(InMemoryCacheTest, EmptyCacheMisses) {
    InMemoryCache storage;

    EXPECT_FALSE(storage.try_hit("https://api.github.com/a").has_value());
    EXPECT_FALSE(storage.load("https://api.github.com/a").has_value());
}

TEST(InMemoryCacheTest, NothingVisibleBeforeCommit) {
    InMemoryCache storage;
    auto writer = storage.writer("https://api.github.com/a", etag("\"1\""), model::HeaderMap{{"Content-Type", "application/json"}});
    writer->write_body("[1,");
    writer->write_body("2]");

    EXPECT_FALSE(storage.try_hit("https://api.github.com/a").has_value());

    writer->commit();

    EXPECT_EQ(storage.try_hit("https://api.github.com/a"), etag("\"1\""));
    auto cached = storage.load("https://api.github.com/a");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body_, "[1,2]");
    EXPECT_EQ(cached->headers_.get("content-type"), "application/json");
}

TEST(InMemoryCacheTest, DroppedWriterLeavesStorageUntouched) {
    InMemoryCache storage;
    {
        auto writer = storage.writer("https://api.github.com/a", etag("\"1\""), {});
        writer->write_body("partial");
    }
    EXPECT_EQ(storage.size(), 0U);
}

TEST(InMemoryCacheTest, NewerEntryOverwrites) {
    InMemoryCache storage;
    auto first = storage.writer("https://api.github.com/a", etag("\"1\""), {});
    first->write_body("old");
    first->commit();

    auto second = storage.writer("https://api.github.com/a", etag("\"2\""), {});
    second->write_body("new");
    second->commit();

    EXPECT_EQ(storage.size(), 1U);
    EXPECT_EQ(storage.try_hit("https://api.github.com/a")->value_, "\"2\"");
    EXPECT_EQ(storage.load("https://api.github.com/a")->body_, "new");
}

TEST(InMemoryCacheTest, ConcurrentWritersOnDistinctUris) {
    InMemoryCache storage;
    const int thread_count = 8;
    const int per_thread = 200;

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&storage, t]() {
            for (int i = 0; i < per_thread; ++i) {
                const std::string uri = "https://api.github.com/t" + std::to_string(t) + "/" + std::to_string(i);
                auto writer = storage.writer(uri, etag(std::to_string(i)), {});
                writer->write_body(uri);
                writer->commit();
                auto cached = storage.load(uri);
                ASSERT_TRUE(cached.has_value());
                EXPECT_EQ(cached->body_, uri);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(storage.size(), static_cast<size_t>(thread_count * per_thread));
}
