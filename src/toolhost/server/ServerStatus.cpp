//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerStatus.cpp
// Purpose: ServerStatus serialization and health rules
//==========================================================================================================

#include "toolhost/server/ServerStatus.h"
#include "toolhost/JSONHelpers.h"

namespace toolhost {
namespace server {

const char* toString(ServerState s) {
    switch (s) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        case ServerState::Stopping: return "stopping";
        case ServerState::Error: return "error";
        case ServerState::Recovering: return "recovering";
    }
    return "unknown";
}

JSONValue ServerStatus::ToJSON() const {
    json::ObjectBuilder errorStatus;
    errorStatus.Set("consecutiveErrors", consecutiveErrors)
               .Set("maxConsecutiveErrors", maxConsecutiveErrors)
               .Set("recoveryAttempts", recoveryAttempts);
    if (lastError) {
        errorStatus.Set("lastError", json::ObjectBuilder()
                                         .Set("message", lastError->message)
                                         .Set("timestamp", json::Timestamp(lastError->timestamp))
                                         .Build());
    } else {
        errorStatus.SetNull("lastError");
    }

    json::ObjectBuilder out;
    out.Set("isRunning", isRunning)
       .Set("serverState", toString(state))
       .Set("uptime", uptimeMs)
       .Set("activeSessions", static_cast<uint64_t>(activeSessions))
       .Set("errorStatus", errorStatus.Build())
       .Set("healthMonitoring", json::ObjectBuilder()
                                    .Set("enabled", healthMonitoring)
                                    .Set("interval", healthCheckInterval)
                                    .Build())
       .Set("toolStatistics", tools.ToJSON());
    if (startTime) {
        out.Set("startTime", json::Timestamp(*startTime));
    } else {
        out.SetNull("startTime");
    }
    return out.Build();
}

registry::HealthLevel OverallHealth(const ServerStatus& status, const registry::RegistryHealth& registryHealth) {
    if (status.state == ServerState::Error) return registry::HealthLevel::Error;
    if (status.consecutiveErrors > 0 || status.state == ServerState::Recovering) {
        return registry::HealthLevel::Warning;
    }
    return registryHealth.status;
}

bool IsReady(const ServerStatus& status, const registry::RegistryHealth& registryHealth) {
    return status.isRunning && registryHealth.status != registry::HealthLevel::Error &&
           status.consecutiveErrors == 0;
}

bool IsAlive(const ServerStatus& status) {
    return status.state != ServerState::Error && status.consecutiveErrors < status.maxConsecutiveErrors;
}

} // namespace server
} // namespace toolhost
