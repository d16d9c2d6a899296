//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Configuration validation and summaries
//==========================================================================================================

#include "toolhost/ServerConfig.h"
#include "toolhost/JSONHelpers.h"
#include "toolhost/errors/Errors.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace toolhost {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool validPort(int p) {
    return p >= 1024 && p <= 65535;
}

} // namespace

const char* toString(TransportType t) {
    return t == TransportType::HttpStream ? "httpStream" : "stdio";
}

const char* toString(StdioFraming f) {
    return f == StdioFraming::ContentLength ? "content-length" : "ndjson";
}

std::optional<TransportType> transportTypeFromString(const std::string& s) {
    if (s == "stdio") return TransportType::Stdio;
    if (s == "httpStream" || s == "http") return TransportType::HttpStream;
    return std::nullopt;
}

std::optional<StdioFraming> stdioFramingFromString(const std::string& s) {
    if (s == "ndjson" || s == "line") return StdioFraming::Ndjson;
    if (s == "content-length") return StdioFraming::ContentLength;
    return std::nullopt;
}

int ServerConfig::EffectiveHealthPort() const {
    if (healthCheck.port.has_value()) return *healthCheck.port;
    if (transport.port.has_value()) return *transport.port + 1;
    return 3002;
}

std::vector<std::string> CollectConfigProblems(const ServerConfig& c) {
    std::vector<std::string> problems;

    if (isBlank(c.name)) problems.emplace_back("Server name is required");
    static const std::regex semver(R"(^\d+\.\d+\.\d+$)");
    if (!std::regex_match(c.version, semver)) {
        problems.emplace_back("Server version must follow semantic versioning (e.g., 1.0.0)");
    }
    if (isBlank(c.description)) problems.emplace_back("Server description is required");

    if (c.transport.type == TransportType::HttpStream) {
        if (!c.transport.port.has_value()) {
            problems.emplace_back("Port is required for httpStream transport");
        } else if (!validPort(*c.transport.port)) {
            problems.emplace_back("Port must be between 1024 and 65535");
        }
        if (c.transport.endpoint.empty() || c.transport.endpoint.front() != '/') {
            problems.emplace_back("Transport endpoint must start with /");
        }
        if (c.transport.scheme != "http" && c.transport.scheme != "https") {
            problems.emplace_back("Transport scheme must be http or https");
        } else if (c.transport.scheme == "https" && (c.transport.certFile.empty() || c.transport.keyFile.empty())) {
            problems.emplace_back("https transport requires certFile and keyFile");
        }
    }

    if (c.timeout < 1000) problems.emplace_back("Timeout must be at least 1000ms");

    const LifecycleConfig& l = c.lifecycle;
    if (l.startupTimeout < 5000) problems.emplace_back("Startup timeout must be at least 5000ms");
    if (l.shutdownTimeout < 1000) problems.emplace_back("Shutdown timeout must be at least 1000ms");
    if (l.healthCheckInterval < 10000) problems.emplace_back("Health check interval must be at least 10000ms");
    if (l.maxRetries < 0) problems.emplace_back("Max retries must be non-negative");
    if (l.retryDelay < 1000) problems.emplace_back("Retry delay must be at least 1000ms");
    if (l.recoveryGracePeriod < 0) problems.emplace_back("Recovery grace period must be non-negative");

    const ErrorHandlingConfig& e = c.errorHandling;
    if (e.maxConsecutiveErrors < 1) problems.emplace_back("Max consecutive errors must be at least 1");
    if (e.errorRecoveryDelay < 1000) problems.emplace_back("Error recovery delay must be at least 1000ms");

    if (c.healthCheck.enabled) {
        if (!validPort(c.EffectiveHealthPort())) {
            problems.emplace_back("Health check port must be between 1024 and 65535");
        }
        const HealthEndpoints& ep = c.healthCheck.endpoints;
        for (const std::string* path : {&ep.health, &ep.ready, &ep.live}) {
            if (path->empty() || path->front() != '/') {
                problems.emplace_back("Health check endpoint '" + *path + "' must start with /");
            }
        }
    }
    return problems;
}

void ValidateServerConfig(const ServerConfig& config) {
    auto problems = CollectConfigProblems(config);
    if (!problems.empty()) {
        throw errors::ConfigurationError(std::move(problems));
    }
}

JSONValue ServerConfig::SummaryJSON() const {
    json::ObjectBuilder t;
    t.Set("type", toString(transport.type));
    if (transport.type == TransportType::HttpStream) {
        t.Set("address", transport.address)
         .Set("endpoint", transport.endpoint)
         .Set("scheme", transport.scheme);
        if (transport.port) t.Set("port", *transport.port);
    } else {
        t.Set("framing", toString(transport.framing));
    }

    return json::ObjectBuilder()
        .Set("name", name)
        .Set("version", version)
        .Set("transport", t.Build())
        .Set("timeout", timeout)
        .Set("lifecycle", json::ObjectBuilder()
                              .Set("startupTimeout", lifecycle.startupTimeout)
                              .Set("shutdownTimeout", lifecycle.shutdownTimeout)
                              .Set("healthCheckInterval", lifecycle.healthCheckInterval)
                              .Set("maxRetries", lifecycle.maxRetries)
                              .Set("retryDelay", lifecycle.retryDelay)
                              .Set("recoveryGracePeriod", lifecycle.recoveryGracePeriod)
                              .Build())
        .Set("errorHandling", json::ObjectBuilder()
                                  .Set("enableRecovery", errorHandling.enableRecovery)
                                  .Set("logErrors", errorHandling.logErrors)
                                  .Set("maxConsecutiveErrors", errorHandling.maxConsecutiveErrors)
                                  .Set("errorRecoveryDelay", errorHandling.errorRecoveryDelay)
                                  .Build())
        .Set("healthCheck", json::ObjectBuilder()
                                .Set("enabled", healthCheck.enabled)
                                .Set("address", healthCheck.address)
                                .Set("port", EffectiveHealthPort())
                                .Set("endpoints", json::ObjectBuilder()
                                                      .Set("health", healthCheck.endpoints.health)
                                                      .Set("ready", healthCheck.endpoints.ready)
                                                      .Set("live", healthCheck.endpoints.live)
                                                      .Build())
                                .Build())
        .Build();
}

} // namespace toolhost
