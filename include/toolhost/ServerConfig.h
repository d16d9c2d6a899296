//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration structure, defaults and eager validation
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

enum class TransportType { Stdio, HttpStream };
enum class StdioFraming { Ndjson, ContentLength };

const char* toString(TransportType t);
const char* toString(StdioFraming f);
std::optional<TransportType> transportTypeFromString(const std::string& s);
std::optional<StdioFraming> stdioFramingFromString(const std::string& s);

//==========================================================================================================
// TransportConfig
// Fields:
//   type: stdio (default) or httpStream.
//   address/port/endpoint: HTTP bind address, listen port and JSON-RPC path (httpStream only).
//   framing: stdio message framing.
//   scheme: "http" or "https"; https requires certFile and keyFile (PEM).
//==========================================================================================================
struct TransportConfig {
    TransportType type{TransportType::Stdio};
    std::string address{"127.0.0.1"};
    std::optional<int> port;
    std::string endpoint{"/mcp"};
    StdioFraming framing{StdioFraming::Ndjson};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
};

//==========================================================================================================
// LifecycleConfig
// Purpose: Timing of start/stop races, health monitoring and recovery (all values in ms).
//==========================================================================================================
struct LifecycleConfig {
    int64_t startupTimeout{30000};
    int64_t shutdownTimeout{15000};
    int64_t healthCheckInterval{30000};
    int maxRetries{3};
    int64_t retryDelay{5000};
    // Pause between the stop and the restart of a recovery attempt.
    int64_t recoveryGracePeriod{2000};
};

struct ErrorHandlingConfig {
    bool enableRecovery{true};
    bool logErrors{true};
    int maxConsecutiveErrors{5};
    int64_t errorRecoveryDelay{10000};
};

struct HealthEndpoints {
    std::string health{"/health"};
    std::string ready{"/ready"};
    std::string live{"/live"};
};

//==========================================================================================================
// HealthCheckConfig
// Notes:
//   When port is unset the probe listener uses the transport port + 1, or 3002 without one.
//==========================================================================================================
struct HealthCheckConfig {
    bool enabled{true};
    std::string address{"127.0.0.1"};
    std::optional<int> port;
    HealthEndpoints endpoints;
};

struct LoggingConfig {
    std::string level{"info"};
    std::optional<std::string> filePath;
};

struct ServerConfig {
    std::string name{"toolhost"};
    std::string version{"1.0.0"};
    std::string description{"Resilient tool server"};
    TransportConfig transport;
    int64_t timeout{30000};
    LifecycleConfig lifecycle;
    ErrorHandlingConfig errorHandling;
    HealthCheckConfig healthCheck;
    LoggingConfig logging;

    int EffectiveHealthPort() const;

    // Non-secret configuration summary for diagnostics.
    JSONValue SummaryJSON() const;
};

//==========================================================================================================
// ValidateServerConfig
// Purpose: Checks every invariant and reports all violations at once.
// Notes:
//   Throws errors::ConfigurationError("Invalid server configuration: p1; p2") when any check fails.
//==========================================================================================================
void ValidateServerConfig(const ServerConfig& config);

// Same checks, returning the problem list instead of throwing.
std::vector<std::string> CollectConfigProblems(const ServerConfig& config);

} // namespace toolhost
