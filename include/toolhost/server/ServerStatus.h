//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerStatus.h
// Purpose: Lifecycle states, runtime status snapshots and the health/readiness/liveness rules
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/registry/ToolTypes.h"

namespace toolhost {
namespace server {

enum class ServerState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
    Recovering
};

const char* toString(ServerState s);

struct LastError {
    std::string message;
    std::chrono::system_clock::time_point timestamp{};
};

//==========================================================================================================
// ServerStatus
// Purpose: Point-in-time copy of the lifecycle controller's runtime state.
// Fields:
//   state/isRunning: Lifecycle state and whether the transport is serving.
//   startTime/uptimeMs: Set while running; uptimeMs is 0 otherwise.
//   activeSessions: Connected peers (0 when not running).
//   consecutiveErrors/maxConsecutiveErrors: Error budget usage and its ceiling.
//   lastError: Most recent lifecycle-level error, if any.
//   recoveryAttempts: Attempts made by the current recovery sequence.
//   healthMonitoring/healthCheckInterval: Whether periodic checks are running, and their period.
//   tools: Registry usage statistics.
//==========================================================================================================
struct ServerStatus {
    ServerState state{ServerState::Stopped};
    bool isRunning{false};
    std::optional<std::chrono::system_clock::time_point> startTime;
    int64_t uptimeMs{0};
    std::size_t activeSessions{0};
    int consecutiveErrors{0};
    int maxConsecutiveErrors{5};
    std::optional<LastError> lastError;
    int recoveryAttempts{0};
    bool healthMonitoring{false};
    int64_t healthCheckInterval{0};
    registry::UsageStatistics tools;

    JSONValue ToJSON() const;
};

// state error -> error; errors pending or recovering -> warning; then the registry's own level.
registry::HealthLevel OverallHealth(const ServerStatus& status, const registry::RegistryHealth& registryHealth);

// Running, registry not in error and no consecutive errors.
bool IsReady(const ServerStatus& status, const registry::RegistryHealth& registryHealth);

// Not in the error state and below the consecutive-error ceiling.
bool IsAlive(const ServerStatus& status);

} // namespace server
} // namespace toolhost
