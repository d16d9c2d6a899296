//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheManager.hpp
// Purpose: Layered in-memory LRU cache with TTL, memory ceilings, metrics and a health summary
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace cache {

enum class CacheLayer {
    ToolResults,
    Discovery
};

const char* toString(CacheLayer layer);

//==========================================================================================================
// LayerConfig
// Fields:
//   maxSize: Entry ceiling; inserting beyond it evicts the least recently used entry.
//   ttl: Default time to live; zero keeps entries until evicted.
//   maxMemory: Estimated byte ceiling (2 bytes per serialized JSON character).
//==========================================================================================================
struct LayerConfig {
    std::size_t maxSize{100};
    std::chrono::milliseconds ttl{std::chrono::minutes(5)};
    std::size_t maxMemory{10 * 1024 * 1024};
};

struct CacheConfig {
    LayerConfig toolResults{200, std::chrono::minutes(5), 30 * 1024 * 1024};
    LayerConfig discovery{50, std::chrono::minutes(5), 10 * 1024 * 1024};
};

struct LayerMetrics {
    uint64_t hits{0};
    uint64_t misses{0};
    double hitRate{0.0};
    std::size_t entryCount{0};
    std::size_t memoryUsage{0};
    uint64_t evictions{0};
};

enum class CacheStatus {
    Healthy,
    Degraded,
    Critical
};

const char* toString(CacheStatus s);

struct CacheHealth {
    CacheStatus status{CacheStatus::Healthy};
    std::size_t totalMemoryUsage{0};
    std::size_t totalMemoryLimit{0};
    std::size_t totalEntries{0};
    double overallHitRate{0.0};
    uint64_t totalLookups{0};
    std::map<std::string, LayerMetrics> layers;

    JSONValue ToJSON() const;
};

class CacheManager {
public:
    explicit CacheManager(CacheConfig config = {});
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Returns the cached value and refreshes its recency; expired entries count as misses.
    std::optional<JSONValue> Get(CacheLayer layer, const std::string& key);

    //==========================================================================================================
    // Set
    // Purpose: Stores value under key, evicting least recently used entries until the layer's size and
    //          memory ceilings hold.
    // Args:
    //   ttl: Overrides the layer default when set.
    // Returns:
    //   false when the value alone exceeds the layer's memory ceiling (nothing is stored).
    //==========================================================================================================
    bool Set(CacheLayer layer, const std::string& key, const JSONValue& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Returns true when an entry was removed.
    bool Invalidate(CacheLayer layer, const std::string& key);

    void ClearLayer(CacheLayer layer);

    LayerMetrics Metrics(CacheLayer layer) const;

    //==========================================================================================================
    // Health
    // Notes:
    //   critical: memory above 90% of the combined limit, or overall hit rate below 0.5.
    //   degraded: memory above 75%, or hit rate below 0.7.
    //   Hit-rate rules apply only once at least one lookup has been made.
    //==========================================================================================================
    CacheHealth Health() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace toolhost
