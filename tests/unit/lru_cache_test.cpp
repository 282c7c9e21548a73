#include <gtest/gtest.h>
#include "lru_cache.hpp"
#include <thread>
#include <atomic>
#include <vector>
#include <memory>

class LruCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_ = std::make_unique<LruCache<std::string, int>>(3); // Small capacity for testing
    }

    std::unique_ptr<LruCache<std::string, int>> cache_;
};

TEST_F(LruCacheTest, BasicSetAndGet) {
    cache_->set("a", 1);

    auto retrieved = cache_->get("a");
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ(retrieved.value(), 1);
}

TEST_F(LruCacheTest, GetMissingKey) {
    EXPECT_FALSE(cache_->get("missing").has_value());
}

TEST_F(LruCacheTest, UpdateExistingKey) {
    cache_->set("a", 1);
    cache_->set("a", 2);

    EXPECT_EQ(cache_->size(), 1);
    EXPECT_EQ(cache_->get("a").value(), 2);
}

TEST_F(LruCacheTest, LRUEviction) {
    cache_->set("a", 1);
    cache_->set("b", 2);
    cache_->set("c", 3);
    EXPECT_EQ(cache_->size(), 3);

    // Should evict least recently used (a)
    cache_->set("d", 4);

    EXPECT_EQ(cache_->size(), 3);
    EXPECT_FALSE(cache_->get("a").has_value());
    EXPECT_TRUE(cache_->get("b").has_value());
    EXPECT_TRUE(cache_->get("c").has_value());
    EXPECT_TRUE(cache_->get("d").has_value());
}

TEST_F(LruCacheTest, LRUOrderingWithGet) {
    cache_->set("a", 1);
    cache_->set("b", 2);
    cache_->set("c", 3);

    // a becomes most recently used, b is now the oldest
    cache_->get("a");
    cache_->set("d", 4);

    EXPECT_TRUE(cache_->get("a").has_value());
    EXPECT_FALSE(cache_->get("b").has_value());
    EXPECT_TRUE(cache_->get("c").has_value());
    EXPECT_TRUE(cache_->get("d").has_value());
}

TEST_F(LruCacheTest, OverwriteRefreshesRecency) {
    cache_->set("a", 1);
    cache_->set("b", 2);
    cache_->set("c", 3);

    cache_->set("a", 10);
    cache_->set("d", 4);

    EXPECT_FALSE(cache_->contains("b"));
    EXPECT_TRUE(cache_->contains("a"));
    EXPECT_EQ(cache_->get("a").value(), 10);
}

TEST_F(LruCacheTest, ContainsDoesNotTouchStatsOrRecency) {
    cache_->set("a", 1);
    cache_->set("b", 2);
    cache_->set("c", 3);

    EXPECT_TRUE(cache_->contains("a"));
    EXPECT_FALSE(cache_->contains("zzz"));

    auto stats = cache_->stats();
    EXPECT_EQ(stats.total_requests, 0u);
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);

    // contains("a") must not have saved a from eviction
    cache_->set("d", 4);
    EXPECT_FALSE(cache_->contains("a"));
}

TEST_F(LruCacheTest, StatsCountHitsAndMisses) {
    cache_->set("a", 1);
    cache_->get("a");
    cache_->get("a");
    cache_->get("b");
    cache_->get("c");

    auto stats = cache_->stats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 2u);
    EXPECT_EQ(stats.total_requests, 4u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.capacity, 3u);
    EXPECT_DOUBLE_EQ(stats.hit_rate_percent, 50.0);
    EXPECT_GE(stats.uptime_seconds, 0.0);
}

TEST_F(LruCacheTest, HitRateIsZeroWithoutRequests) {
    auto stats = cache_->stats();
    EXPECT_EQ(stats.total_requests, 0u);
    EXPECT_DOUBLE_EQ(stats.hit_rate_percent, 0.0);
}

TEST_F(LruCacheTest, ClearResetsEntriesAndCounters) {
    cache_->set("a", 1);
    cache_->set("b", 2);
    cache_->get("a");
    cache_->get("x");

    cache_->clear();

    EXPECT_EQ(cache_->size(), 0);
    auto stats = cache_->stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.total_requests, 0u);
    EXPECT_FALSE(cache_->get("a").has_value());
}

TEST_F(LruCacheTest, ZeroCapacityHoldsOneEntry) {
    LruCache<std::string, int> tiny(0);
    EXPECT_EQ(tiny.capacity(), 1u);

    tiny.set("a", 1);
    tiny.set("b", 2);
    EXPECT_EQ(tiny.size(), 1u);
    EXPECT_TRUE(tiny.contains("b"));
}

TEST_F(LruCacheTest, ThreadSafety) {
    const int num_threads = 10;
    const int operations_per_thread = 100;

    std::vector<std::thread> threads;
    std::atomic<int> successful_operations{0};

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < operations_per_thread; ++i) {
                std::string key = "key_" + std::to_string(t) + "_" + std::to_string(i);
                cache_->set(key, i);
                auto retrieved = cache_->get(key);
                if (retrieved.has_value() && retrieved.value() == i) {
                    successful_operations++;
                }
                cache_->stats();
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    // Eviction means not every read succeeds, but nothing may break
    EXPECT_GT(successful_operations.load(), 0);
    EXPECT_LE(cache_->size(), 3u);

    auto stats = cache_->stats();
    EXPECT_EQ(stats.total_requests, static_cast<uint64_t>(num_threads * operations_per_thread));
    EXPECT_EQ(stats.hits + stats.misses, stats.total_requests);
}

TEST(LoggableKeyTest, TruncatesLongKeys) {
    EXPECT_EQ(loggableKey("addr_short"), "addr_short");
    EXPECT_EQ(loggableKey(std::string(50, 'k')), std::string(50, 'k'));
    EXPECT_EQ(loggableKey(std::string(80, 'k')), std::string(50, 'k') + "...");
}
