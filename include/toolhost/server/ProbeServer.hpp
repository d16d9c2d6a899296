//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProbeServer.hpp
// Purpose: HTTP health, readiness and liveness endpoints for external orchestration
//==========================================================================================================

#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/cache/CacheManager.hpp"
#include "toolhost/server/ServerStatus.h"
#include "toolhost/transport/HttpListener.hpp"

namespace toolhost {
namespace server {

//==========================================================================================================
// IProbeSource
// Purpose: Read-only view of the server the probe endpoints report on.
//==========================================================================================================
class IProbeSource {
public:
    virtual ~IProbeSource() = default;

    virtual ServerStatus GetStatus() const = 0;
    virtual registry::RegistryHealth GetRegistryHealth() const = 0;
    virtual cache::CacheHealth GetCacheHealth() const = 0;

    //==========================================================================================================
    // Deeper diagnostics returned under "detailed" by /health?detailed=true.
    // Returns:
    //   Object with usage statistics, circuit breakers, categories, tags and the configuration summary.
    //==========================================================================================================
    virtual JSONValue GetDiagnostics() const = 0;

    virtual const ServerConfig& Config() const = 0;
};

//==========================================================================================================
// ProbeServer
// Purpose: Serves /health, /ready, /live and a service index at / on the health-check port.
// Notes:
//   - GET and HEAD are served; OPTIONS on any path answers 200 (CORS preflight).
//   - /health answers 200 for healthy and warning, 503 for error. /ready and /live answer 200 or 503.
//   - Unknown paths answer 404 and other methods 405 with "Allow: GET, HEAD, OPTIONS".
//   - Every response carries the CORS headers and a JSON body.
//==========================================================================================================
class ProbeServer {
public:
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{0};
        HealthEndpoints endpoints;
    };

    ProbeServer(const Options& opts, const IProbeSource& source);
    ~ProbeServer();

    ProbeServer(const ProbeServer&) = delete;
    ProbeServer& operator=(const ProbeServer&) = delete;

    // Binds the listener. Exceptional future on bind failure.
    std::future<void> Start();
    std::future<void> Stop();

    bool IsRunning() const;
    uint16_t BoundPort() const;

    // Routes one request without the network; the listener uses the same function.
    transport::HttpResponse Handle(const transport::HttpRequest& request) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace server
} // namespace toolhost
