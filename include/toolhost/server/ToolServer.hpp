//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServer.hpp
// Purpose: Lifecycle controller: start/stop state machine, error budget, recovery and request dispatch
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolhost/ExecutionWrapper.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/server/HealthMonitor.hpp"
#include "toolhost/server/ProbeServer.hpp"
#include "toolhost/server/ServerContext.hpp"
#include "toolhost/server/ServerStatus.h"
#include "toolhost/transport/Transport.h"

namespace toolhost {
namespace server {

//==========================================================================================================
// TransportFactory
// Purpose: Creates the acceptor for one start attempt. Every start (including recovery restarts) gets
//          a fresh acceptor so an abandoned attempt can never interfere with a later one.
//==========================================================================================================
using TransportFactory = std::function<std::unique_ptr<transport::ITransportAcceptor>(const ServerConfig&)>;

// stdio or HTTP acceptor as selected by config.transport.
std::unique_ptr<transport::ITransportAcceptor> MakeConfiguredTransport(const ServerConfig& config);

//==========================================================================================================
// ToolServer
// Purpose: Serves registered tools over a transport and keeps itself available.
// Notes:
//   - States: stopped -> starting -> running -> stopping -> stopped, with error and recovering on
//     failure paths. Start and stop are raced against startupTimeout/shutdownTimeout.
//   - Lifecycle-level failures (start, stop, health checks, probe bind) count toward the consecutive
//     error budget. Reaching maxConsecutiveErrors moves the server to error and, when recovery is
//     enabled, starts one serialized recovery sequence of at most maxRetries attempts.
//   - Tool failures are returned to callers as failure envelopes and do not consume the budget.
//   - Stop() halts health monitoring and the probe listener before the transport.
//==========================================================================================================
class ToolServer : public IProbeSource {
public:
    //==========================================================================================================
    // Constructor
    // Args:
    //   config: Server configuration; validated here (throws errors::ConfigurationError).
    //   context: Registry, error handler and cache shared with the tools. Must outlive the server.
    //   transportFactory: Acceptor factory; defaults to MakeConfiguredTransport.
    //==========================================================================================================
    ToolServer(ServerConfig config, ServerContext& context, TransportFactory transportFactory = {});
    ~ToolServer() override;

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Starts the transport, then health monitoring and the probe listener.
    // Returns:
    //   Ready future on success. Exceptional future when already running, when the transport fails to
    //   start, or with errors::TimeoutError when startupTimeout elapses first.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Cancels pending recovery, stops monitoring and probes, then the transport.
    // Returns:
    //   Ready future (also when already stopped). Exceptional future with errors::TimeoutError when the
    //   transport does not stop within shutdownTimeout; the server is then left in error.
    //==========================================================================================================
    std::future<void> Stop();

    // Stop (when running), pause for recoveryGracePeriod, start. Blocks the caller.
    std::future<void> Restart();

    // Runs Restart() on a background thread; failures are logged and counted.
    void ScheduleRestart();

    bool IsRunning() const;
    ServerState State() const;

    // Zeroes the error counters, clears lastError and leaves the error state.
    void ResetErrors();

    // Starts or stops periodic health checks. Returns whether monitoring is now active.
    bool SetHealthMonitoringEnabled(bool enabled);
    bool IsHealthMonitoringEnabled() const;

    // Extra dependency check run on every pass; throwing counts as a health-check failure.
    void AddHealthCheck(const std::string& name, HealthMonitor::CheckFn check);

    // One immediate health pass on the calling thread.
    HealthReport RunHealthCheck();

    //==========================================================================================================
    // RegisterTool
    // Purpose: Wraps handler with the execution wrapper and registers it.
    // Notes:
    //   Throws errors::RegistrationError on duplicates or validation failures. Clears cached discovery
    //   results.
    //==========================================================================================================
    void RegisterTool(const registry::ToolMetadata& metadata,
                      std::shared_ptr<const registry::IParameterContract> parameters,
                      ToolHandler handler,
                      const registry::RegistrationOptions& options = {});

    // Registers with category "legacy", version 1.0.0 and tag "legacy"; validation off, replacement on.
    void RegisterTool(const std::string& name, const std::string& description,
                      std::shared_ptr<const registry::IParameterContract> parameters,
                      ToolHandler handler);

    // Registry mutations that also drop cached discovery results.
    void SetToolActive(const std::string& name, bool isActive);
    void UpdateToolMetadata(const std::string& name, const registry::ToolMetadataPatch& patch);
    void UnregisterTool(const std::string& name);

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes a registered tool through its wrapped invoker.
    // Returns:
    //   The tool's outcome. An inactive tool yields a NotFound-kind failure.
    // Notes:
    //   Throws errors::NotFoundError when no tool has that name.
    //==========================================================================================================
    errors::ToolOutcome CallTool(const std::string& name, const JSONValue& arguments);

    // JSON-RPC dispatch used by the transport (initialize, ping, tools/list, tools/call).
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request);
    void HandleNotification(std::unique_ptr<JSONRPCNotification> notification);

    // Receives transport-level errors (for example EOF on stdin) after they are logged.
    void SetTransportErrorHandler(std::function<void(const std::string&)> handler);

    //==========================================================================================================
    // HandleServerError
    // Purpose: Shared error path for lifecycle failures: counts, records, categorizes and may schedule
    //          recovery. Never blocks on recovery itself.
    //==========================================================================================================
    void HandleServerError(const std::exception& error, const std::string& operation);

    // Probe listener port actually bound (0 when not listening).
    uint16_t ProbePort() const;

    // Status plus registry health, usage, categories, tags, breakers, cache health and process metrics.
    JSONValue GetDetailedHealth() const;

    ServerContext& Context() const;
    ExecutionWrapper& Wrapper() const;

    // IProbeSource
    ServerStatus GetStatus() const override;
    registry::RegistryHealth GetRegistryHealth() const override;
    cache::CacheHealth GetCacheHealth() const override;
    JSONValue GetDiagnostics() const override;
    const ServerConfig& Config() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace server
} // namespace toolhost
