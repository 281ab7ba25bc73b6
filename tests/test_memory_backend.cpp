#include <gtest/gtest.h>

#include "cache/memory_backend.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace memento;
using cache::MemoryBackend;
using cache::MemoryBackendConfig;
using namespace std::chrono_literals;

TEST(MemoryBackend, missReturnsNothing) {
    MemoryBackend backend;
    EXPECT_FALSE(backend.get("absent").has_value());
}

TEST(MemoryBackend, setThenGet) {
    MemoryBackend backend;
    backend.set("k", core::Value{{"answer", 42}}, 60s);

    auto value = backend.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["answer"].get<int>(), 42);
}

TEST(MemoryBackend, setOverwrites) {
    MemoryBackend backend;
    backend.set("k", 1, 60s);
    backend.set("k", 2, 60s);
    EXPECT_EQ(backend.get("k").value().get<int>(), 2);
    EXPECT_EQ(backend.size(), 1u);
}

TEST(MemoryBackend, nullIsAValue) {
    MemoryBackend backend;
    backend.set("k", nullptr, 60s);
    auto value = backend.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_null());
}

TEST(MemoryBackend, removeIsNoOpOnMiss) {
    MemoryBackend backend;
    backend.set("k", 1, 60s);
    backend.remove("k");
    backend.remove("k");
    EXPECT_FALSE(backend.get("k").has_value());
}

TEST(MemoryBackend, namespacedKeys) {
    MemoryBackend backend(MemoryBackendConfig{"app", 3, 0});
    EXPECT_EQ(backend.make_key("k"), "app:3:k");
}

TEST(MemoryBackend, versionsDoNotShareEntries) {
    MemoryBackend first(MemoryBackendConfig{"app", 1, 0});
    MemoryBackend second(MemoryBackendConfig{"app", 2, 0});
    EXPECT_NE(first.make_key("k"), second.make_key("k"));
}

TEST(MemoryBackend, entriesExpire) {
    MemoryBackend backend;
    backend.set("short", 1, 1s);
    backend.set("forever", 2, 0s);

    EXPECT_TRUE(backend.get("short").has_value());
    std::this_thread::sleep_for(1100ms);

    EXPECT_FALSE(backend.get("short").has_value());
    EXPECT_TRUE(backend.get("forever").has_value());
    EXPECT_EQ(backend.get_stats().expired, 1u);
}

TEST(MemoryBackend, ttlBeyondClockRangeNeverExpires) {
    MemoryBackend backend;
    backend.set("k", 1, std::chrono::hours(24 * 365 * 300));
    backend.set("max", 2, std::chrono::seconds::max());

    EXPECT_EQ(backend.get("k").value().get<int>(), 1);
    EXPECT_EQ(backend.get("max").value().get<int>(), 2);
    EXPECT_EQ(backend.get_stats().expired, 0u);
}

TEST(MemoryBackend, evictsLeastRecentlyUsed) {
    MemoryBackend backend(MemoryBackendConfig{"", 1, 2});
    backend.set("a", 1, 60s);
    backend.set("b", 2, 60s);

    // Touch a so b is the oldest
    EXPECT_TRUE(backend.get("a").has_value());
    backend.set("c", 3, 60s);

    EXPECT_EQ(backend.size(), 2u);
    EXPECT_TRUE(backend.get("a").has_value());
    EXPECT_FALSE(backend.get("b").has_value());
    EXPECT_TRUE(backend.get("c").has_value());
    EXPECT_EQ(backend.get_stats().evictions, 1u);
}

TEST(MemoryBackend, deletePrefix) {
    MemoryBackend backend;
    for (int i = 0; i < 5; ++i) {
        backend.set("m:f:[" + std::to_string(i) + "]", i, 60s);
        backend.set("m:g:[" + std::to_string(i) + "]", i, 60s);
    }

    auto removed = backend.delete_prefix("m:f:");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 5u);
    EXPECT_EQ(backend.size(), 5u);
    EXPECT_FALSE(backend.get("m:f:[0]").has_value());
    EXPECT_TRUE(backend.get("m:g:[0]").has_value());
}

TEST(MemoryBackend, deleteEmptyPrefixRemovesNothing) {
    MemoryBackend backend;
    backend.set("k", 1, 60s);
    EXPECT_EQ(backend.delete_prefix("").value(), 0u);
    EXPECT_EQ(backend.size(), 1u);
}

TEST(MemoryBackend, deleteMany) {
    MemoryBackend backend;
    backend.set("a", 1, 60s);
    backend.set("b", 2, 60s);
    backend.set("c", 3, 60s);

    backend.delete_many({"a", "c", "missing"});
    EXPECT_EQ(backend.size(), 1u);
    EXPECT_TRUE(backend.get("b").has_value());
}

TEST(MemoryBackend, clear) {
    MemoryBackend backend;
    backend.set("a", 1, 60s);
    backend.set("b", 2, 60s);
    backend.clear();
    EXPECT_EQ(backend.size(), 0u);
}

TEST(MemoryBackend, stats) {
    MemoryBackend backend(MemoryBackendConfig{"", 1, 10});
    backend.set("a", 1, 60s);
    backend.get("a");
    backend.get("a");
    backend.get("b");

    auto stats = backend.get_stats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.max_entries, 10u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 2.0 / 3.0);
}

TEST(MemoryBackend, invalidArguments) {
    EXPECT_THROW(MemoryBackend(MemoryBackendConfig{"a:b", 1, 0}), std::invalid_argument);

    MemoryBackend backend;
    EXPECT_THROW(backend.set("k", 1, -1s), std::invalid_argument);
}

TEST(MemoryBackend, concurrentAccess) {
    MemoryBackend backend(MemoryBackendConfig{"", 1, 64});
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&backend, t]() {
            for (int i = 0; i < 200; ++i) {
                auto key = "k" + std::to_string((t * 200 + i) % 100);
                backend.set(key, i, 60s);
                backend.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(backend.size(), 64u);
}
