//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cache.cpp
// Purpose: GoogleTests for the layered LRU cache: expiry, eviction, metrics and health rules
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "toolhost/JSONHelpers.h"
#include "toolhost/cache/CacheManager.hpp"

using namespace toolhost;
using namespace toolhost::cache;
using namespace std::chrono_literals;

namespace {

JSONValue value(int n) {
    return json::ObjectBuilder().Set("n", n).Build();
}

CacheConfig smallConfig() {
    CacheConfig cfg;
    cfg.toolResults = LayerConfig{2, std::chrono::milliseconds(0), 1024 * 1024};
    cfg.discovery = LayerConfig{10, std::chrono::milliseconds(50), 1024 * 1024};
    return cfg;
}

} // namespace

TEST(CacheManagerTest, GetReturnsStoredValue) {
    CacheManager cache(smallConfig());
    EXPECT_FALSE(cache.Get(CacheLayer::ToolResults, "k").has_value());
    ASSERT_TRUE(cache.Set(CacheLayer::ToolResults, "k", value(1)));
    auto v = cache.Get(CacheLayer::ToolResults, "k");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(json::GetInt(*v, "n").value_or(0), 1);

    LayerMetrics m = cache.Metrics(CacheLayer::ToolResults);
    EXPECT_EQ(m.hits, 1u);
    EXPECT_EQ(m.misses, 1u);
    EXPECT_DOUBLE_EQ(m.hitRate, 0.5);
    EXPECT_EQ(m.entryCount, 1u);
    EXPECT_GT(m.memoryUsage, 0u);
}

TEST(CacheManagerTest, LayersAreIndependent) {
    CacheManager cache(smallConfig());
    cache.Set(CacheLayer::ToolResults, "k", value(1));
    EXPECT_FALSE(cache.Get(CacheLayer::Discovery, "k").has_value());
}

TEST(CacheManagerTest, EvictsLeastRecentlyUsed) {
    CacheManager cache(smallConfig());
    cache.Set(CacheLayer::ToolResults, "a", value(1));
    cache.Set(CacheLayer::ToolResults, "b", value(2));
    ASSERT_TRUE(cache.Get(CacheLayer::ToolResults, "a").has_value());
    cache.Set(CacheLayer::ToolResults, "c", value(3));

    EXPECT_TRUE(cache.Get(CacheLayer::ToolResults, "a").has_value());
    EXPECT_FALSE(cache.Get(CacheLayer::ToolResults, "b").has_value());
    EXPECT_TRUE(cache.Get(CacheLayer::ToolResults, "c").has_value());
    EXPECT_EQ(cache.Metrics(CacheLayer::ToolResults).evictions, 1u);
}

TEST(CacheManagerTest, EntriesExpireAfterTtl) {
    CacheManager cache(smallConfig());
    cache.Set(CacheLayer::Discovery, "short", value(1));
    cache.Set(CacheLayer::Discovery, "long", value(2), std::chrono::milliseconds(60000));
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(cache.Get(CacheLayer::Discovery, "short").has_value());
    EXPECT_TRUE(cache.Get(CacheLayer::Discovery, "long").has_value());
    EXPECT_EQ(cache.Metrics(CacheLayer::Discovery).entryCount, 1u);
}

TEST(CacheManagerTest, OversizedValueIsRejected) {
    CacheConfig cfg;
    cfg.discovery = LayerConfig{10, std::chrono::milliseconds(0), 16};
    CacheManager cache(cfg);
    EXPECT_FALSE(cache.Set(CacheLayer::Discovery, "big", json::ObjectBuilder().Set("s", std::string(64, 'x')).Build()));
    EXPECT_EQ(cache.Metrics(CacheLayer::Discovery).entryCount, 0u);
}

TEST(CacheManagerTest, InvalidateAndClear) {
    CacheManager cache(smallConfig());
    cache.Set(CacheLayer::Discovery, "a", value(1));
    cache.Set(CacheLayer::Discovery, "b", value(2));
    EXPECT_TRUE(cache.Invalidate(CacheLayer::Discovery, "a"));
    EXPECT_FALSE(cache.Invalidate(CacheLayer::Discovery, "a"));

    cache.ClearLayer(CacheLayer::Discovery);
    LayerMetrics m = cache.Metrics(CacheLayer::Discovery);
    EXPECT_EQ(m.entryCount, 0u);
    EXPECT_EQ(m.memoryUsage, 0u);
}

TEST(CacheManagerTest, HealthIgnoresHitRateWithoutLookups) {
    CacheManager cache(smallConfig());
    cache.Set(CacheLayer::ToolResults, "a", value(1));
    CacheHealth h = cache.Health();
    EXPECT_EQ(h.status, CacheStatus::Healthy);
    EXPECT_EQ(h.totalLookups, 0u);
    EXPECT_EQ(h.totalEntries, 1u);
    EXPECT_EQ(h.layers.size(), 2u);
}

TEST(CacheManagerTest, HealthDegradesWithHitRate) {
    CacheManager cache(smallConfig());
    cache.Set(CacheLayer::ToolResults, "a", value(1));

    // 2 hits, 1 miss: 0.67 -> degraded
    cache.Get(CacheLayer::ToolResults, "a");
    cache.Get(CacheLayer::ToolResults, "a");
    cache.Get(CacheLayer::ToolResults, "missing");
    EXPECT_EQ(cache.Health().status, CacheStatus::Degraded);

    // 2 hits, 3 misses: 0.4 -> critical
    cache.Get(CacheLayer::ToolResults, "missing");
    cache.Get(CacheLayer::ToolResults, "missing");
    CacheHealth h = cache.Health();
    EXPECT_EQ(h.status, CacheStatus::Critical);
    EXPECT_EQ(json::GetString(h.ToJSON(), "status").value_or(""), "critical");
}
