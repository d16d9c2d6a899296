//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheManager.cpp
// Purpose: CacheManager implementation
//==========================================================================================================

#include "toolhost/cache/CacheManager.hpp"
#include "toolhost/JSONHelpers.h"
#include "logging/Logger.h"

#include <list>
#include <mutex>
#include <unordered_map>

namespace toolhost {
namespace cache {

const char* toString(CacheLayer layer) {
    return layer == CacheLayer::Discovery ? "discovery" : "tool_results";
}

const char* toString(CacheStatus s) {
    switch (s) {
        case CacheStatus::Healthy: return "healthy";
        case CacheStatus::Degraded: return "degraded";
        case CacheStatus::Critical: return "critical";
    }
    return "healthy";
}

JSONValue CacheHealth::ToJSON() const {
    json::ObjectBuilder layerObj;
    for (const auto& [name, m] : layers) {
        layerObj.Set(name, json::ObjectBuilder()
                               .Set("hits", static_cast<uint64_t>(m.hits))
                               .Set("misses", static_cast<uint64_t>(m.misses))
                               .Set("hitRate", m.hitRate)
                               .Set("entryCount", static_cast<uint64_t>(m.entryCount))
                               .Set("memoryUsage", static_cast<uint64_t>(m.memoryUsage))
                               .Set("evictions", static_cast<uint64_t>(m.evictions))
                               .Build());
    }
    return json::ObjectBuilder()
        .Set("status", toString(status))
        .Set("hitRate", overallHitRate)
        .Set("memoryUsage", static_cast<uint64_t>(totalMemoryUsage))
        .Set("memoryLimit", static_cast<uint64_t>(totalMemoryLimit))
        .Set("entryCount", static_cast<uint64_t>(totalEntries))
        .Set("layers", layerObj.Build())
        .Build();
}

namespace {

using Clock = std::chrono::steady_clock;

struct Entry {
    std::string key;
    JSONValue value;
    std::size_t size{0};
    std::optional<Clock::time_point> expiresAt;
};

struct Layer {
    LayerConfig config;
    // Front is most recently used.
    std::list<Entry> lru;
    std::unordered_map<std::string, std::list<Entry>::iterator> index;
    LayerMetrics metrics;

    void erase(std::list<Entry>::iterator it) {
        metrics.memoryUsage -= it->size;
        index.erase(it->key);
        lru.erase(it);
        metrics.entryCount = lru.size();
    }

    void updateHitRate() {
        const uint64_t total = metrics.hits + metrics.misses;
        metrics.hitRate = total > 0 ? static_cast<double>(metrics.hits) / static_cast<double>(total) : 0.0;
    }
};

std::size_t estimateSize(const std::string& key, const JSONValue& value) {
    return (SerializeJSON(value).size() + key.size()) * 2;
}

} // namespace

class CacheManager::Impl {
public:
    explicit Impl(const CacheConfig& config) {
        layers[CacheLayer::ToolResults].config = config.toolResults;
        layers[CacheLayer::Discovery].config = config.discovery;
    }

    mutable std::mutex mutex;
    std::map<CacheLayer, Layer> layers;
};

CacheManager::CacheManager(CacheConfig config) : pImpl(std::make_unique<Impl>(config)) {}

CacheManager::~CacheManager() = default;

std::optional<JSONValue> CacheManager::Get(CacheLayer layer, const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    Layer& l = pImpl->layers[layer];
    auto it = l.index.find(key);
    if (it == l.index.end()) {
        l.metrics.misses++;
        l.updateHitRate();
        return std::nullopt;
    }
    if (it->second->expiresAt && Clock::now() >= *it->second->expiresAt) {
        l.erase(it->second);
        l.metrics.misses++;
        l.updateHitRate();
        return std::nullopt;
    }
    l.lru.splice(l.lru.begin(), l.lru, it->second);
    l.metrics.hits++;
    l.updateHitRate();
    return l.lru.front().value;
}

bool CacheManager::Set(CacheLayer layer, const std::string& key, const JSONValue& value,
                       std::optional<std::chrono::milliseconds> ttl) {
    const std::size_t size = estimateSize(key, value);
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    Layer& l = pImpl->layers[layer];
    if (size > l.config.maxMemory || l.config.maxSize == 0) {
        LOG_WARN("Cache entry {} in {} exceeds layer limits ({} bytes)", key, toString(layer), size);
        return false;
    }

    auto existing = l.index.find(key);
    if (existing != l.index.end()) {
        l.erase(existing->second);
    }

    while (!l.lru.empty() &&
           (l.lru.size() >= l.config.maxSize || l.metrics.memoryUsage + size > l.config.maxMemory)) {
        auto victim = std::prev(l.lru.end());
        LOG_DEBUG("Evicting {} from cache layer {}", victim->key, toString(layer));
        l.erase(victim);
        l.metrics.evictions++;
    }

    Entry e;
    e.key = key;
    e.value = value;
    e.size = size;
    const auto effectiveTtl = ttl.value_or(l.config.ttl);
    if (effectiveTtl.count() > 0) {
        e.expiresAt = Clock::now() + effectiveTtl;
    }
    l.lru.push_front(std::move(e));
    l.index[key] = l.lru.begin();
    l.metrics.memoryUsage += size;
    l.metrics.entryCount = l.lru.size();
    return true;
}

bool CacheManager::Invalidate(CacheLayer layer, const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    Layer& l = pImpl->layers[layer];
    auto it = l.index.find(key);
    if (it == l.index.end()) return false;
    l.erase(it->second);
    return true;
}

void CacheManager::ClearLayer(CacheLayer layer) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    Layer& l = pImpl->layers[layer];
    l.lru.clear();
    l.index.clear();
    l.metrics.memoryUsage = 0;
    l.metrics.entryCount = 0;
    LOG_DEBUG("Cleared cache layer {}", toString(layer));
}

LayerMetrics CacheManager::Metrics(CacheLayer layer) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->layers.find(layer);
    return it == pImpl->layers.end() ? LayerMetrics{} : it->second.metrics;
}

CacheHealth CacheManager::Health() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    CacheHealth h;
    uint64_t hits = 0;
    for (const auto& [layer, l] : pImpl->layers) {
        h.totalMemoryUsage += l.metrics.memoryUsage;
        h.totalMemoryLimit += l.config.maxMemory;
        h.totalEntries += l.metrics.entryCount;
        hits += l.metrics.hits;
        h.totalLookups += l.metrics.hits + l.metrics.misses;
        h.layers[toString(layer)] = l.metrics;
    }
    h.overallHitRate = h.totalLookups > 0 ? static_cast<double>(hits) / static_cast<double>(h.totalLookups) : 0.0;

    const double memoryRatio = h.totalMemoryLimit > 0
                                   ? static_cast<double>(h.totalMemoryUsage) / static_cast<double>(h.totalMemoryLimit)
                                   : 0.0;
    const bool rated = h.totalLookups > 0;
    if (memoryRatio > 0.9 || (rated && h.overallHitRate < 0.5)) {
        h.status = CacheStatus::Critical;
    } else if (memoryRatio > 0.75 || (rated && h.overallHitRate < 0.7)) {
        h.status = CacheStatus::Degraded;
    }
    return h;
}

} // namespace cache
} // namespace toolhost
