//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProbeServer.cpp
// Purpose: ProbeServer routing and response bodies
//==========================================================================================================

#include "toolhost/server/ProbeServer.hpp"
#include "toolhost/JSONHelpers.h"
#include "logging/Logger.h"

#include <chrono>
#include <cmath>

namespace toolhost {
namespace server {

using transport::HttpRequest;
using transport::HttpResponse;

namespace {

constexpr const char* kAllowedMethods = "GET, HEAD, OPTIONS";

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

void addCors(HttpResponse& res) {
    res.headers.emplace_back("Access-Control-Allow-Origin", "*");
    res.headers.emplace_back("Access-Control-Allow-Methods", kAllowedMethods);
    res.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

HttpResponse jsonResponse(unsigned status, const JSONValue& body) {
    HttpResponse res;
    res.status = status;
    res.body = SerializeJSON(body);
    addCors(res);
    return res;
}

int64_t elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

class ProbeServer::Impl {
public:
    Impl(const ProbeServer::Options& o, const IProbeSource& s) : opts(o), source(s) {
        transport::HttpListener::Options lo;
        lo.address = opts.address;
        lo.port = opts.port;
        lo.name = "ProbeServer";
        listener = std::make_unique<transport::HttpListener>(
            lo, [this](const HttpRequest& req) { return route(req); });
    }

    ProbeServer::Options opts;
    const IProbeSource& source;
    std::unique_ptr<transport::HttpListener> listener;

    HttpResponse route(const HttpRequest& req) const {
        if (req.method == "OPTIONS") {
            HttpResponse res;
            res.contentType.clear();
            addCors(res);
            return res;
        }
        if (req.method != "GET" && req.method != "HEAD") {
            HttpResponse res = jsonResponse(405, json::ObjectBuilder()
                                                     .Set("error", "Method Not Allowed")
                                                     .Set("message", req.method + " method not allowed")
                                                     .Build());
            res.headers.emplace_back("Allow", kAllowedMethods);
            return res;
        }

        const auto& ep = opts.endpoints;
        if (req.path == ep.health) {
            auto it = req.query.find("detailed");
            return health(it != req.query.end() && it->second == "true");
        }
        if (req.path == ep.ready) return ready();
        if (req.path == ep.live) return live();
        if (req.path == "/") return index();

        LOG_DEBUG("ProbeServer: no route for {} {}", req.method, req.path);
        return jsonResponse(404, json::ObjectBuilder()
                                     .Set("error", "Not Found")
                                     .Set("message", "Endpoint " + req.path + " not found")
                                     .Set("availableEndpoints", std::vector<std::string>{ep.health, ep.ready, ep.live})
                                     .Build());
    }

    HttpResponse health(bool detailed) const {
        const auto started = std::chrono::steady_clock::now();
        try {
            const ServerConfig& cfg = source.Config();
            const ServerStatus status = source.GetStatus();
            const registry::RegistryHealth registryHealth = source.GetRegistryHealth();
            const cache::CacheHealth cacheHealth = source.GetCacheHealth();
            const registry::HealthLevel overall = OverallHealth(status, registryHealth);

            json::ObjectBuilder errorsObj;
            errorsObj.Set("consecutiveErrors", status.consecutiveErrors)
                     .Set("recoveryAttempts", status.recoveryAttempts);
            if (status.lastError) {
                errorsObj.Set("lastError", json::ObjectBuilder()
                                               .Set("message", status.lastError->message)
                                               .Set("timestamp", json::Timestamp(status.lastError->timestamp))
                                               .Build());
            } else {
                errorsObj.SetNull("lastError");
            }

            json::ObjectBuilder body;
            body.Set("status", registry::toString(overall))
                .Set("server", json::ObjectBuilder()
                                   .Set("name", cfg.name)
                                   .Set("version", cfg.version)
                                   .Set("state", toString(status.state))
                                   .Set("uptime", status.uptimeMs / 1000)
                                   .Set("isRunning", status.isRunning)
                                   .Set("activeSessions", static_cast<uint64_t>(status.activeSessions))
                                   .Build())
                .Set("errors", errorsObj.Build())
                .Set("toolRegistry", json::ObjectBuilder()
                                         .Set("status", registry::toString(registryHealth.status))
                                         .Set("totalTools", static_cast<uint64_t>(registryHealth.totalTools))
                                         .Set("activeTools", static_cast<uint64_t>(registryHealth.activeTools))
                                         .Set("issues", registryHealth.issues)
                                         .Build())
                .Set("cache", json::ObjectBuilder()
                                  .Set("status", cache::toString(cacheHealth.status))
                                  .Set("hitRate", round2(cacheHealth.overallHitRate))
                                  .Set("memoryUsage",
                                       round2(static_cast<double>(cacheHealth.totalMemoryUsage) / 1024.0 / 1024.0))
                                  .Set("entryCount", static_cast<uint64_t>(cacheHealth.totalEntries))
                                  .Set("layers", static_cast<uint64_t>(cacheHealth.layers.size()))
                                  .Build());
            if (detailed) {
                body.Set("detailed", source.GetDiagnostics());
            }
            body.Set("healthCheck", json::ObjectBuilder()
                                        .Set("responseTime", elapsedMs(started))
                                        .Set("timestamp", json::Now())
                                        .Build());

            return jsonResponse(overall == registry::HealthLevel::Error ? 503 : 200, body.Build());
        } catch (const std::exception& e) {
            LOG_ERROR("ProbeServer: health endpoint failed: {}", e.what());
            return jsonResponse(503, json::ObjectBuilder()
                                         .Set("status", "error")
                                         .Set("error", "Health check failed")
                                         .Set("timestamp", json::Now())
                                         .Build());
        }
    }

    HttpResponse ready() const {
        const auto started = std::chrono::steady_clock::now();
        try {
            const ServerConfig& cfg = source.Config();
            const ServerStatus status = source.GetStatus();
            const registry::RegistryHealth registryHealth = source.GetRegistryHealth();
            const bool isReady = IsReady(status, registryHealth);

            JSONValue body = json::ObjectBuilder()
                .Set("ready", isReady)
                .Set("server", cfg.name)
                .Set("version", cfg.version)
                .Set("state", toString(status.state))
                .Set("checks", json::ObjectBuilder()
                                   .Set("serverRunning", status.isRunning)
                                   .Set("toolRegistryHealthy", registryHealth.status != registry::HealthLevel::Error)
                                   .Set("noConsecutiveErrors", status.consecutiveErrors == 0)
                                   .Build())
                .Set("responseTime", elapsedMs(started))
                .Set("timestamp", json::Now())
                .Build();
            return jsonResponse(isReady ? 200 : 503, body);
        } catch (const std::exception& e) {
            LOG_ERROR("ProbeServer: ready endpoint failed: {}", e.what());
            return jsonResponse(503, json::ObjectBuilder()
                                         .Set("ready", false)
                                         .Set("error", "Readiness check failed")
                                         .Set("timestamp", json::Now())
                                         .Build());
        }
    }

    HttpResponse live() const {
        const auto started = std::chrono::steady_clock::now();
        try {
            const ServerConfig& cfg = source.Config();
            const ServerStatus status = source.GetStatus();
            const bool isAlive = IsAlive(status);

            JSONValue body = json::ObjectBuilder()
                .Set("alive", isAlive)
                .Set("server", cfg.name)
                .Set("version", cfg.version)
                .Set("state", toString(status.state))
                .Set("uptime", status.uptimeMs / 1000)
                .Set("checks", json::ObjectBuilder()
                                   .Set("notInErrorState", status.state != ServerState::Error)
                                   .Set("belowErrorThreshold", status.consecutiveErrors < status.maxConsecutiveErrors)
                                   .Set("processResponsive", true)
                                   .Build())
                .Set("responseTime", elapsedMs(started))
                .Set("timestamp", json::Now())
                .Build();
            return jsonResponse(isAlive ? 200 : 503, body);
        } catch (const std::exception& e) {
            LOG_ERROR("ProbeServer: live endpoint failed: {}", e.what());
            return jsonResponse(503, json::ObjectBuilder()
                                         .Set("alive", false)
                                         .Set("error", "Liveness check failed")
                                         .Set("timestamp", json::Now())
                                         .Build());
        }
    }

    HttpResponse index() const {
        const ServerConfig& cfg = source.Config();
        const ServerStatus status = source.GetStatus();
        const auto& ep = opts.endpoints;
        return jsonResponse(200, json::ObjectBuilder()
                                     .Set("service", cfg.name)
                                     .Set("version", cfg.version)
                                     .Set("description", cfg.description)
                                     .Set("status", toString(status.state))
                                     .Set("endpoints", json::ObjectBuilder()
                                                           .Set("health", ep.health)
                                                           .Set("ready", ep.ready)
                                                           .Set("live", ep.live)
                                                           .Build())
                                     .Set("timestamp", json::Now())
                                     .Build());
    }
};

ProbeServer::ProbeServer(const Options& opts, const IProbeSource& source)
    : pImpl(std::make_unique<Impl>(opts, source)) {}

ProbeServer::~ProbeServer() {
    pImpl->listener->Stop().get();
}

std::future<void> ProbeServer::Start() {
    return pImpl->listener->Start();
}

std::future<void> ProbeServer::Stop() {
    return pImpl->listener->Stop();
}

bool ProbeServer::IsRunning() const {
    return pImpl->listener->IsRunning();
}

uint16_t ProbeServer::BoundPort() const {
    return pImpl->listener->BoundPort();
}

transport::HttpResponse ProbeServer::Handle(const transport::HttpRequest& request) const {
    return pImpl->route(request);
}

} // namespace server
} // namespace toolhost
