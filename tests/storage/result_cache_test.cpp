// File: tests/storage/result_cache_test.cpp
#include "storage/result_cache.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace codedup {
namespace {

CacheKey Key(float threshold, size_t record_count = 10) {
    CacheKey key;
    key.threshold = threshold;
    key.mode = SearchMode::FAST;
    key.include_trivial = false;
    key.record_count = record_count;
    return key;
}

ResultCache::Result OnePair(float similarity) {
    CodeRecord a;
    a.content_hash = "a";
    CodeRecord b;
    b.content_hash = "b";
    return {DuplicatePair::Canonical(a, b, similarity)};
}

const Timestamp kT1 = Timestamp::FromMicros(1000);
const Timestamp kT2 = Timestamp::FromMicros(2000);

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(ResultCacheTest, ConstructorSetsCapacity) {
    ResultCache cache(10);
    EXPECT_EQ(10u, cache.Capacity());
    EXPECT_EQ(0u, cache.Size());
}

TEST(ResultCacheTest, ZeroCapacitySetToOne) {
    ResultCache cache(0);
    EXPECT_EQ(1u, cache.Capacity());
}

TEST(ResultCacheTest, PutAndGet) {
    ResultCache cache;
    cache.Put(Key(0.7f), OnePair(0.9f), kT1);

    auto result = cache.Get(Key(0.7f), kT1);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(1u, result->size());
    EXPECT_FLOAT_EQ(0.9f, (*result)[0].similarity);
}

TEST(ResultCacheTest, KeyFieldsAllMatter) {
    ResultCache cache;
    cache.Put(Key(0.7f), OnePair(0.9f), kT1);

    CacheKey other_mode = Key(0.7f);
    other_mode.mode = SearchMode::EXHAUSTIVE;
    CacheKey other_trivial = Key(0.7f);
    other_trivial.include_trivial = true;

    EXPECT_FALSE(cache.Get(Key(0.8f), kT1).has_value());
    EXPECT_FALSE(cache.Get(Key(0.7f, 11), kT1).has_value());
    EXPECT_FALSE(cache.Get(other_mode, kT1).has_value());
    EXPECT_FALSE(cache.Get(other_trivial, kT1).has_value());
}

TEST(ResultCacheTest, EmptyResultIsCached) {
    ResultCache cache;
    cache.Put(Key(0.9f), {}, kT1);

    auto result = cache.Get(Key(0.9f), kT1);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

// ============================================================================
// Staleness Tests
// ============================================================================

TEST(ResultCacheTest, NewerDataMakesEntryStale) {
    ResultCache cache;
    cache.Put(Key(0.7f), OnePair(0.9f), kT1);

    EXPECT_FALSE(cache.Get(Key(0.7f), kT2).has_value());
    EXPECT_TRUE(cache.Contains(Key(0.7f)));

    auto stats = cache.GetStats();
    EXPECT_EQ(1u, stats.misses);
    EXPECT_EQ(1u, stats.stale_misses);
    EXPECT_EQ(0u, stats.hits);
}

TEST(ResultCacheTest, OlderCurrentMaxStillHits) {
    ResultCache cache;
    cache.Put(Key(0.7f), OnePair(0.9f), kT2);
    EXPECT_TRUE(cache.Get(Key(0.7f), kT1).has_value());
}

TEST(ResultCacheTest, PutRefreshesStaleEntry) {
    ResultCache cache;
    cache.Put(Key(0.7f), OnePair(0.9f), kT1);
    cache.Put(Key(0.7f), OnePair(0.8f), kT2);

    auto result = cache.Get(Key(0.7f), kT2);
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(0.8f, (*result)[0].similarity);
    EXPECT_EQ(1u, cache.Size());
}

// ============================================================================
// Eviction Tests
// ============================================================================

TEST(ResultCacheTest, EvictsLeastRecentlyUsed) {
    ResultCache cache(2);
    cache.Put(Key(0.1f), {}, kT1);
    cache.Put(Key(0.2f), {}, kT1);

    // Touch 0.1 so that 0.2 becomes the oldest
    ASSERT_TRUE(cache.Get(Key(0.1f), kT1).has_value());
    cache.Put(Key(0.3f), {}, kT1);

    EXPECT_TRUE(cache.Contains(Key(0.1f)));
    EXPECT_FALSE(cache.Contains(Key(0.2f)));
    EXPECT_TRUE(cache.Contains(Key(0.3f)));
    EXPECT_EQ(1u, cache.GetStats().evictions);
}

TEST(ResultCacheTest, RemoveAndClear) {
    ResultCache cache;
    cache.Put(Key(0.1f), {}, kT1);
    cache.Put(Key(0.2f), {}, kT1);

    EXPECT_TRUE(cache.Remove(Key(0.1f)));
    EXPECT_FALSE(cache.Remove(Key(0.1f)));
    EXPECT_EQ(1u, cache.Size());

    ASSERT_TRUE(cache.Get(Key(0.2f), kT1).has_value());
    cache.Clear();
    EXPECT_EQ(0u, cache.Size());
    // Statistics survive Clear()
    EXPECT_EQ(1u, cache.GetStats().hits);
}

TEST(ResultCacheTest, ConcurrentAccess) {
    ResultCache cache(16);
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 200; ++i) {
                CacheKey key = Key(0.1f * static_cast<float>(i % 8), static_cast<size_t>(t));
                cache.Put(key, {}, kT1);
                cache.Get(key, kT1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = cache.GetStats();
    EXPECT_LE(cache.Size(), 16u);
    EXPECT_EQ(800u, stats.hits + stats.misses);
}

} // namespace
} // namespace codedup
