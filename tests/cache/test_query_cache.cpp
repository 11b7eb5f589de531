// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "atom/error/exception.hpp"
#include "cache/query_cache.hpp"
#include "manual_clock.hpp"

using namespace qcache::cache;
using namespace std::chrono_literals;
using qcache::test::ManualClock;

namespace {
auto key(const std::string& name) -> CacheKey {
    return deriveKey(name, "https://data.example.org/sparql", "json");
}
}  // namespace

class QueryCacheTest : public ::testing::Test {
protected:
    auto makeCache(size_t maxSize, EvictionPolicyKind policy,
                   std::chrono::seconds ttl = 60s) -> QueryCache {
        return QueryCache(maxSize, ttl, policy, clock.source());
    }

    ManualClock clock;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(QueryCacheTest, RejectsZeroCapacity) {
    EXPECT_THROW(QueryCache(0, 60s, EvictionPolicyKind::LRU),
                 atom::error::InvalidArgument);
}

TEST_F(QueryCacheTest, RejectsNonPositiveTtl) {
    EXPECT_THROW(QueryCache(10, 0s, EvictionPolicyKind::LRU),
                 atom::error::InvalidArgument);
    EXPECT_THROW(QueryCache(10, -5s, EvictionPolicyKind::FIFO),
                 atom::error::InvalidArgument);
}

TEST_F(QueryCacheTest, ReportsParameters) {
    auto cache = makeCache(42, EvictionPolicyKind::LFU, 300s);
    EXPECT_EQ(cache.maxSize(), 42u);
    EXPECT_EQ(cache.ttl(), 300s);
    EXPECT_EQ(cache.policy(), EvictionPolicyKind::LFU);
    EXPECT_EQ(cache.size(), 0u);
}

// ============================================================================
// Basic operations
// ============================================================================

TEST_F(QueryCacheTest, SetThenGet) {
    auto cache = makeCache(4, EvictionPolicyKind::LRU);
    cache.set(key("A"), json{{"rows", 3}});

    auto value = cache.get(key("A"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["rows"], 3);
    EXPECT_FALSE(cache.get(key("B")).has_value());
}

TEST_F(QueryCacheTest, OverwriteReplacesValueWithoutEviction) {
    auto cache = makeCache(2, EvictionPolicyKind::LRU);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);
    cache.set(key("A"), 10);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get(key("A")).value_or(json()), json(10));
    EXPECT_EQ(cache.get(key("B")).value_or(json()), json(2));
}

TEST_F(QueryCacheTest, Invalidate) {
    auto cache = makeCache(4, EvictionPolicyKind::FIFO);
    cache.set(key("A"), 1);

    EXPECT_TRUE(cache.invalidate(key("A")));
    EXPECT_FALSE(cache.invalidate(key("A")));
    EXPECT_FALSE(cache.get(key("A")).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(QueryCacheTest, ClearEmptiesCacheAndPolicy) {
    auto cache = makeCache(2, EvictionPolicyKind::LRU);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);

    // Policy state was reset too: filling again evicts only new keys.
    cache.set(key("C"), 3);
    cache.set(key("D"), 4);
    cache.set(key("E"), 5);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.contains(key("C")));
    EXPECT_TRUE(cache.contains(key("D")));
    EXPECT_TRUE(cache.contains(key("E")));
}

TEST_F(QueryCacheTest, ReturnedValueIsACopy) {
    auto cache = makeCache(2, EvictionPolicyKind::LRU);
    cache.set(key("A"), json{{"n", 1}});

    auto value = cache.get(key("A"));
    ASSERT_TRUE(value.has_value());
    (*value)["n"] = 99;
    EXPECT_EQ((*cache.get(key("A")))["n"], 1);
}

// ============================================================================
// Capacity, for every policy
// ============================================================================

class QueryCacheCapacityTest
    : public ::testing::TestWithParam<EvictionPolicyKind> {};

TEST_P(QueryCacheCapacityTest, SizeNeverExceedsMaxSize) {
    ManualClock clock;
    QueryCache cache(5, 60s, GetParam(), clock.source());

    for (int i = 0; i < 50; ++i) {
        cache.set(key("K" + std::to_string(i)), i);
        EXPECT_LE(cache.size(), 5u);
        if (i % 3 == 0) {
            (void)cache.get(key("K" + std::to_string(i / 2)));
        }
    }
    EXPECT_EQ(cache.size(), 5u);
    EXPECT_TRUE(cache.contains(key("K49")));
}

INSTANTIATE_TEST_SUITE_P(AllPolicies, QueryCacheCapacityTest,
                         ::testing::Values(EvictionPolicyKind::LRU,
                                           EvictionPolicyKind::LFU,
                                           EvictionPolicyKind::FIFO),
                         [](const auto& info) {
                             return policyToString(info.param);
                         });

// ============================================================================
// TTL
// ============================================================================

TEST_F(QueryCacheTest, EntryLiveJustBeforeTtl) {
    auto cache = makeCache(4, EvictionPolicyKind::LRU, 10s);
    cache.set(key("A"), 1);

    clock.advance(9999ms);
    EXPECT_TRUE(cache.contains(key("A")));
    EXPECT_TRUE(cache.get(key("A")).has_value());
}

TEST_F(QueryCacheTest, EntryExpiresAtTtl) {
    auto cache = makeCache(4, EvictionPolicyKind::LRU, 10s);
    cache.set(key("A"), 1);

    clock.advance(10s);
    EXPECT_FALSE(cache.contains(key("A")));
    // contains() leaves the expired entry in place.
    EXPECT_EQ(cache.size(), 1u);

    EXPECT_FALSE(cache.get(key("A")).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(QueryCacheTest, ReadsDoNotExtendLifetime) {
    auto cache = makeCache(4, EvictionPolicyKind::LRU, 10s);
    cache.set(key("A"), 1);

    clock.advance(6s);
    EXPECT_TRUE(cache.get(key("A")).has_value());
    clock.advance(6s);
    EXPECT_FALSE(cache.get(key("A")).has_value());
}

TEST_F(QueryCacheTest, OverwriteRestartsLifetime) {
    auto cache = makeCache(4, EvictionPolicyKind::FIFO, 10s);
    cache.set(key("A"), 1);

    clock.advance(8s);
    cache.set(key("A"), 2);
    clock.advance(8s);
    EXPECT_EQ(cache.get(key("A")).value_or(json()), json(2));
}

TEST_F(QueryCacheTest, ExpiredEntryRemovedFromPolicy) {
    auto cache = makeCache(2, EvictionPolicyKind::FIFO, 10s);
    cache.set(key("A"), 1);
    clock.advance(5s);
    cache.set(key("B"), 2);
    clock.advance(5s);

    // A expires on lookup; B becomes the oldest FIFO entry.
    EXPECT_FALSE(cache.get(key("A")).has_value());
    cache.set(key("C"), 3);
    EXPECT_EQ(cache.size(), 2u);
    cache.set(key("D"), 4);
    EXPECT_FALSE(cache.contains(key("B")));
    EXPECT_TRUE(cache.contains(key("C")));
    EXPECT_TRUE(cache.contains(key("D")));
}

// ============================================================================
// Policy behaviour through the cache
// ============================================================================

TEST_F(QueryCacheTest, LruEvictsLeastRecentlyRead) {
    auto cache = makeCache(3, EvictionPolicyKind::LRU);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);
    cache.set(key("C"), 3);

    EXPECT_TRUE(cache.get(key("A")).has_value());
    cache.set(key("D"), 4);

    EXPECT_TRUE(cache.contains(key("A")));
    EXPECT_FALSE(cache.contains(key("B")));
    EXPECT_TRUE(cache.contains(key("C")));
    EXPECT_TRUE(cache.contains(key("D")));
}

TEST_F(QueryCacheTest, FifoIgnoresReads) {
    auto cache = makeCache(3, EvictionPolicyKind::FIFO);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);
    cache.set(key("C"), 3);

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(cache.get(key("A")).has_value());
    }
    cache.set(key("D"), 4);

    EXPECT_FALSE(cache.contains(key("A")));
    EXPECT_TRUE(cache.contains(key("B")));
}

TEST_F(QueryCacheTest, LfuEvictsLeastFrequentlyRead) {
    auto cache = makeCache(3, EvictionPolicyKind::LFU);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);
    cache.set(key("C"), 3);

    (void)cache.get(key("A"));
    (void)cache.get(key("A"));
    (void)cache.get(key("C"));
    cache.set(key("D"), 4);

    EXPECT_TRUE(cache.contains(key("A")));
    EXPECT_FALSE(cache.contains(key("B")));
    EXPECT_TRUE(cache.contains(key("C")));
    EXPECT_TRUE(cache.contains(key("D")));
}

TEST_F(QueryCacheTest, LfuTieEvictsOldest) {
    auto cache = makeCache(2, EvictionPolicyKind::LFU);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);
    cache.set(key("C"), 3);

    EXPECT_FALSE(cache.contains(key("A")));
    EXPECT_TRUE(cache.contains(key("B")));
    EXPECT_TRUE(cache.contains(key("C")));
}

TEST_F(QueryCacheTest, ContainsDoesNotTouchRecency) {
    auto cache = makeCache(2, EvictionPolicyKind::LRU);
    cache.set(key("A"), 1);
    cache.set(key("B"), 2);

    EXPECT_TRUE(cache.contains(key("A")));
    cache.set(key("C"), 3);

    EXPECT_FALSE(cache.contains(key("A")));
    EXPECT_TRUE(cache.contains(key("B")));
}

TEST_F(QueryCacheTest, SurvivesMove) {
    auto cache = makeCache(2, EvictionPolicyKind::LRU);
    cache.set(key("A"), 1);

    QueryCache moved = std::move(cache);
    EXPECT_EQ(moved.get(key("A")).value_or(json()), json(1));
    EXPECT_EQ(moved.maxSize(), 2u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(QueryCacheTest, ConcurrentAccessKeepsCapacity) {
    QueryCache cache(16, 60s, EvictionPolicyKind::LRU);
    constexpr int THREADS = 8;
    constexpr int OPS = 500;

    std::atomic<int> hits{0};
    std::vector<std::thread> workers;
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&cache, &hits, t] {
            for (int i = 0; i < OPS; ++i) {
                auto k = key("K" + std::to_string((t * OPS + i) % 40));
                if (i % 2 == 0) {
                    cache.set(k, i);
                } else if (cache.get(k).has_value()) {
                    hits.fetch_add(1);
                }
                if (i % 97 == 0) {
                    cache.invalidate(k);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_LE(cache.size(), 16u);
    EXPECT_GE(hits.load(), 0);
}
