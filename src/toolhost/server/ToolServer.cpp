//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServer.cpp
// Purpose: ToolServer lifecycle state machine, recovery and JSON-RPC dispatch
//==========================================================================================================

#include "toolhost/server/ToolServer.hpp"
#include "toolhost/JSONHelpers.h"
#include "toolhost/transport/HTTPServer.hpp"
#include "toolhost/transport/StdioTransport.hpp"
#include "toolhost/version.h"
#include "logging/Logger.h"

#include <sys/resource.h>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace toolhost {
namespace server {

using errors::ErrorKind;
using errors::ToolFailure;
using errors::ToolOutcome;

namespace {

// Decision record shared by a racing operation and its waiter. Whoever takes the mutex first decides.
struct RaceState {
    std::mutex m;
    bool decided{false};
    bool abandoned{false};
};

//==========================================================================================================
// Runs op on a detached thread and waits at most timeout for it.
// Returns when op completed first, rethrows op's exception, or throws TimeoutError. When op succeeds
// after the waiter gave up, onLateSuccess runs on the worker thread so the late effect can be undone.
//==========================================================================================================
void raceAgainstTimeout(std::function<void()> op, std::chrono::milliseconds timeout,
                        const std::string& timeoutMessage, std::function<void()> onLateSuccess) {
    auto race = std::make_shared<RaceState>();
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> fut = done->get_future();

    std::thread([race, done, op = std::move(op), onLate = std::move(onLateSuccess)]() {
        std::exception_ptr failure;
        try {
            op();
        } catch (...) {
            failure = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(race->m);
            if (!race->abandoned) {
                race->decided = true;
                if (failure) {
                    done->set_exception(failure);
                } else {
                    done->set_value();
                }
                return;
            }
        }
        if (!failure && onLate) {
            try {
                onLate();
            } catch (const std::exception& e) {
                LOG_WARN("Cleanup of abandoned lifecycle operation failed: {}", e.what());
            }
        }
    }).detach();

    if (fut.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(race->m);
        if (!race->decided) {
            race->abandoned = true;
            throw errors::TimeoutError(timeoutMessage);
        }
    }
    fut.get();
}

std::string joinIssues(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += "; ";
        out += s;
    }
    return out;
}

JSONValue processMetrics() {
    struct rusage usage{};
    ::getrusage(RUSAGE_SELF, &usage);
    auto toMs = [](const timeval& tv) {
        return static_cast<int64_t>(tv.tv_sec) * 1000 + static_cast<int64_t>(tv.tv_usec) / 1000;
    };
    return json::ObjectBuilder()
        .Set("pid", static_cast<int64_t>(::getpid()))
        .Set("maxResidentSetKb", static_cast<int64_t>(usage.ru_maxrss))
        .Set("userCpuMs", toMs(usage.ru_utime))
        .Set("systemCpuMs", toMs(usage.ru_stime))
        .Set("hardwareThreads", static_cast<int64_t>(std::thread::hardware_concurrency()))
        .Build();
}

} // namespace

std::unique_ptr<transport::ITransportAcceptor> MakeConfiguredTransport(const ServerConfig& config) {
    if (config.transport.type == TransportType::HttpStream) {
        transport::HTTPServer::Options o;
        o.address = config.transport.address;
        o.port = static_cast<uint16_t>(config.transport.port.value_or(0));
        o.rpcPath = config.transport.endpoint;
        o.scheme = config.transport.scheme;
        o.certFile = config.transport.certFile;
        o.keyFile = config.transport.keyFile;
        return std::make_unique<transport::HTTPServer>(o);
    }
    transport::StdioTransport::Options o;
    o.framing = config.transport.framing;
    return std::make_unique<transport::StdioTransport>(o);
}

class ToolServer::Impl {
public:
    Impl(ServerConfig cfg, ServerContext& ctx, TransportFactory f)
        : config(std::move(cfg)),
          context(ctx),
          factory(f ? std::move(f) : TransportFactory(&MakeConfiguredTransport)),
          wrapper(context.registry, context.errorHandler, std::chrono::milliseconds(config.timeout)),
          monitor(std::chrono::milliseconds(config.lifecycle.healthCheckInterval),
                  [this](const std::string& name, const std::exception& e) {
                      handleServerError(e, "health_check:" + name);
                  }) {
        monitor.AddCheck("server", [this]() { builtinHealthCheck(); });
    }

    ServerConfig config;
    ServerContext& context;
    TransportFactory factory;
    ExecutionWrapper wrapper;
    HealthMonitor monitor;
    std::unique_ptr<ProbeServer> probes;
    IProbeSource* probeSource{nullptr};

    // Serializes start, stop, restart and recovery steps.
    std::mutex lifecycleMutex;

    mutable std::mutex transportMutex;
    std::shared_ptr<transport::ITransportAcceptor> transport;

    std::mutex transportErrorMutex;
    std::function<void(const std::string&)> transportErrorHandler;

    mutable std::mutex stateMutex;
    ServerState state{ServerState::Stopped};
    bool isRunning{false};
    std::optional<std::chrono::system_clock::time_point> startTime;
    int consecutiveErrors{0};
    std::optional<LastError> lastError;
    int recoveryAttempts{0};
    bool recoveryActive{false};

    std::atomic<bool> monitoringEnabled{true};

    std::mutex waitMutex;
    std::condition_variable_any waitCv;

    std::mutex workerMutex;
    bool recoveryAllowed{true};
    std::jthread recoveryThread;
    std::jthread restartThread;
    std::atomic<bool> restartInProgress{false};

    // Caller holds stateMutex.
    void transition(ServerState next) {
        if (state != next) {
            LOG_INFO("Server state: {} -> {}", toString(state), toString(next));
            state = next;
        }
    }

    // Returns false when stop was requested before the delay elapsed.
    bool sleepFor(std::stop_token st, std::chrono::milliseconds delay) {
        if (delay.count() <= 0) return !st.stop_requested();
        std::unique_lock<std::mutex> lock(waitMutex);
        return !waitCv.wait_for(lock, st, delay, [&st] { return st.stop_requested(); });
    }

    ///////////////////////////////////////////// Lifecycle /////////////////////////////////////////////

    void allowRecovery() {
        std::lock_guard<std::mutex> lock(workerMutex);
        recoveryAllowed = true;
    }

    // Stops pending recovery and restart work and waits for it to finish.
    void cancelWorkers() {
        std::jthread recovery;
        std::jthread restart;
        {
            std::lock_guard<std::mutex> lock(workerMutex);
            recoveryAllowed = false;
            recovery = std::move(recoveryThread);
            restart = std::move(restartThread);
        }
        for (std::jthread* t : {&recovery, &restart}) {
            if (!t->joinable()) continue;
            t->request_stop();
            if (t->get_id() == std::this_thread::get_id()) {
                t->detach();
            } else {
                t->join();
            }
        }
        std::lock_guard<std::mutex> lock(stateMutex);
        recoveryActive = false;
        if (state == ServerState::Recovering) {
            transition(isRunning ? ServerState::Running : ServerState::Error);
        }
    }

    void startLocked() {
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (isRunning) {
                throw std::runtime_error("Server is already running");
            }
            transition(ServerState::Starting);
        }
        LOG_INFO("Starting server '{}' v{} (transport={})", config.name, config.version,
                 toString(config.transport.type));
        const auto began = std::chrono::steady_clock::now();

        try {
            std::shared_ptr<transport::ITransportAcceptor> t(factory(config));
            if (!t) {
                throw std::runtime_error("Transport factory produced no transport");
            }
            t->SetRequestHandler([this](const JSONRPCRequest& req) { return handleRequest(req); });
            t->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
                handleNotification(std::move(n));
            });
            t->SetErrorHandler([this](const std::string& msg) { onTransportError(msg); });

            const auto budget = std::chrono::milliseconds(config.lifecycle.startupTimeout);
            raceAgainstTimeout(
                [t]() { t->Start().get(); }, budget,
                "Server startup timed out after " + std::to_string(budget.count()) + "ms",
                [t]() {
                    LOG_WARN("Transport started after the startup timeout; stopping it");
                    t->Stop().get();
                });

            std::lock_guard<std::mutex> lock(transportMutex);
            transport = t;
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                isRunning = false;
                transition(ServerState::Error);
            }
            LOG_ERROR("Server startup failed: {}", e.what());
            handleServerError(e, "start");
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(stateMutex);
            isRunning = true;
            startTime = std::chrono::system_clock::now();
            consecutiveErrors = 0;
            transition(ServerState::Running);
        }
        if (monitoringEnabled.load()) {
            monitor.Start();
        }
        startProbes();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - began).count();
        LOG_INFO("Server startup completed in {}ms (healthMonitoring={}, probes={})", elapsed,
                 monitor.IsRunning(), probes ? probes->BoundPort() : 0);
    }

    void stopLocked() {
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (!isRunning && state == ServerState::Stopped) return;
            transition(ServerState::Stopping);
        }

        monitor.Stop();
        stopProbes();

        std::shared_ptr<transport::ITransportAcceptor> t;
        {
            std::lock_guard<std::mutex> lock(transportMutex);
            t = transport;
        }

        try {
            if (t) {
                const auto budget = std::chrono::milliseconds(config.lifecycle.shutdownTimeout);
                raceAgainstTimeout([t]() { t->Stop().get(); }, budget,
                                   "Server shutdown timed out after " + std::to_string(budget.count()) + "ms",
                                   {});
            }
        } catch (const std::exception& e) {
            monitor.Stop();
            {
                std::lock_guard<std::mutex> lock(transportMutex);
                transport.reset();
            }
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                isRunning = false;
                transition(ServerState::Error);
            }
            LOG_ERROR("Server stop failed: {}", e.what());
            handleServerError(e, "stop");
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(transportMutex);
            transport.reset();
        }
        int64_t uptimeSec = 0;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (isRunning && startTime) {
                uptimeSec = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now() - *startTime).count();
            }
            isRunning = false;
            transition(ServerState::Stopped);
        }
        LOG_INFO("Server '{}' stopped (uptime {}s)", config.name, uptimeSec);
    }

    void start() {
        allowRecovery();
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        startLocked();
    }

    void stop() {
        cancelWorkers();
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        stopLocked();
    }

    void restart(std::stop_token st) {
        allowRecovery();
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        bool wasRunning = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            wasRunning = isRunning;
        }
        LOG_INFO("Restarting server (previous state: {})", wasRunning ? "running" : "stopped");
        if (wasRunning) {
            stopLocked();
            if (!sleepFor(st, std::chrono::milliseconds(config.lifecycle.recoveryGracePeriod))) {
                LOG_INFO("Restart cancelled");
                return;
            }
        }
        startLocked();
    }

    void startProbes() {
        if (!config.healthCheck.enabled || probeSource == nullptr) return;
        if (!probes) {
            ProbeServer::Options po;
            po.address = config.healthCheck.address;
            po.port = static_cast<uint16_t>(config.EffectiveHealthPort());
            po.endpoints = config.healthCheck.endpoints;
            probes = std::make_unique<ProbeServer>(po, *probeSource);
        }
        try {
            probes->Start().get();
            LOG_INFO("Health check endpoints available on {}:{} ({}, {}, {})", config.healthCheck.address,
                     probes->BoundPort(), config.healthCheck.endpoints.health, config.healthCheck.endpoints.ready,
                     config.healthCheck.endpoints.live);
        } catch (const std::exception& e) {
            LOG_ERROR("Health check server failed to start: {}", e.what());
            handleServerError(e, "health_check_server");
        }
    }

    void stopProbes() {
        if (probes) {
            probes->Stop().get();
        }
    }

    ////////////////////////////////////////// Error budget //////////////////////////////////////////

    void handleServerError(const std::exception& e, const std::string& operation) {
        const errors::CategorizedError categorized = context.errorHandler.HandleError(e, config.name, operation);
        bool launch = false;
        int count = 0;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            ++consecutiveErrors;
            count = consecutiveErrors;
            lastError = LastError{e.what(), std::chrono::system_clock::now()};
            if (consecutiveErrors >= config.errorHandling.maxConsecutiveErrors) {
                if (state != ServerState::Recovering) {
                    transition(ServerState::Error);
                }
                if (config.errorHandling.enableRecovery && !recoveryActive &&
                    recoveryAttempts < config.lifecycle.maxRetries) {
                    recoveryActive = true;
                    launch = true;
                }
            }
        }
        LOG_WARN("Server error in {} ({} of {} consecutive, {}): {}", operation, count,
                 config.errorHandling.maxConsecutiveErrors, categorized.code, e.what());
        if (launch) {
            launchRecovery();
        }
    }

    void launchRecovery() {
        std::jthread previous;
        {
            std::lock_guard<std::mutex> lock(workerMutex);
            if (!recoveryAllowed) {
                std::lock_guard<std::mutex> stateLock(stateMutex);
                recoveryActive = false;
                return;
            }
            previous = std::move(recoveryThread);
            recoveryThread = std::jthread([this](std::stop_token st) { recoveryLoop(st); });
        }
        if (previous.joinable()) {
            if (previous.get_id() == std::this_thread::get_id()) {
                previous.detach();
            } else {
                previous.join();
            }
        }
    }

    void recoveryLoop(std::stop_token st) {
        const int maxRetries = config.lifecycle.maxRetries;
        while (!st.stop_requested()) {
            int attempt = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                attempt = ++recoveryAttempts;
                transition(ServerState::Recovering);
            }
            LOG_INFO("Attempting server recovery (attempt {}/{})", attempt, maxRetries);
            if (!sleepFor(st, std::chrono::milliseconds(config.errorHandling.errorRecoveryDelay))) break;

            try {
                std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
                bool running = false;
                {
                    std::lock_guard<std::mutex> lock(stateMutex);
                    running = isRunning;
                }
                if (running) {
                    stopLocked();
                }
                if (!sleepFor(st, std::chrono::milliseconds(config.lifecycle.recoveryGracePeriod))) break;
                startLocked();
                {
                    std::lock_guard<std::mutex> lock(stateMutex);
                    consecutiveErrors = 0;
                    recoveryAttempts = 0;
                    recoveryActive = false;
                }
                LOG_INFO("Server recovery successful after {} attempt(s)", attempt);
                return;
            } catch (const std::exception& e) {
                {
                    std::lock_guard<std::mutex> lock(stateMutex);
                    transition(ServerState::Error);
                }
                LOG_ERROR("Server recovery attempt {}/{} failed: {}", attempt, maxRetries, e.what());
                if (attempt >= maxRetries) {
                    LOG_ERROR("Server recovery exhausted after {} attempts; manual intervention required", attempt);
                    break;
                }
            }
            if (!sleepFor(st, std::chrono::milliseconds(config.lifecycle.retryDelay))) break;
        }
        std::lock_guard<std::mutex> lock(stateMutex);
        recoveryActive = false;
    }

    void onTransportError(const std::string& msg) {
        LOG_WARN("Transport error: {}", msg);
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(transportErrorMutex);
            handler = transportErrorHandler;
        }
        if (handler) {
            handler(msg);
        }
    }

    //////////////////////////////////////////// Health ////////////////////////////////////////////

    void builtinHealthCheck() {
        bool running = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            running = isRunning;
        }
        if (!running) {
            LOG_WARN("Health check: server '{}' is not running", config.name);
            return;
        }
        const registry::RegistryHealth rh = context.registry.GetHealthStatus();
        if (rh.status == registry::HealthLevel::Error) {
            LOG_ERROR("Health check: tool registry has errors: {}", joinIssues(rh.issues));
        } else if (rh.status == registry::HealthLevel::Warning) {
            LOG_WARN("Health check: tool registry warnings: {}", joinIssues(rh.issues));
        }
        LOG_DEBUG("Health check: {} tools ({} active), {} active sessions", rh.totalTools, rh.activeTools,
                  activeSessions());
    }

    std::size_t activeSessions() const {
        std::lock_guard<std::mutex> lock(transportMutex);
        return transport ? transport->ActiveSessions() : 0;
    }

    ServerStatus status() const {
        ServerStatus s;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            s.state = state;
            s.isRunning = isRunning;
            s.startTime = startTime;
            s.consecutiveErrors = consecutiveErrors;
            s.lastError = lastError;
            s.recoveryAttempts = recoveryAttempts;
        }
        s.maxConsecutiveErrors = config.errorHandling.maxConsecutiveErrors;
        s.healthMonitoring = monitor.IsRunning();
        s.healthCheckInterval = monitor.Interval().count();
        if (s.isRunning && s.startTime) {
            s.uptimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now() - *s.startTime).count();
            s.activeSessions = activeSessions();
        }
        s.tools = context.registry.GetUsageStatistics();
        return s;
    }

    ////////////////////////////////////////// Dispatch //////////////////////////////////////////

    void invalidateDiscovery() {
        context.cache.ClearLayer(cache::CacheLayer::Discovery);
    }

    ToolOutcome callTool(const std::string& name, const JSONValue& arguments) {
        std::optional<registry::RegisteredTool> tool = context.registry.GetTool(name);
        if (!tool) {
            throw errors::NotFoundError("Tool '" + name + "' not found");
        }
        if (!tool->isActive) {
            errors::NotFoundError err("Tool '" + name + "' is not active");
            return ToolFailure{ErrorKind::NotFound, context.errorHandler.HandleError(err, name, "execute")};
        }
        return tool->invoker(arguments);
    }

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req) {
        LOG_INFO("Handling initialize request");
        JSONValue result = json::ObjectBuilder()
            .Set("protocolVersion", kProtocolVersion)
            .Set("capabilities", json::ObjectBuilder()
                                     .Set("tools", json::ObjectBuilder().Set("listChanged", false).Build())
                                     .Set("logging", json::EmptyObject())
                                     .Build())
            .Set("serverInfo", json::ObjectBuilder()
                                   .Set("name", config.name)
                                   .Set("version", config.version)
                                   .Build())
            .Set("instructions", config.description)
            .Build();
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        registry::ToolFilter active;
        active.isActive = true;
        JSONValue::Array tools;
        for (const auto& t : context.registry.DiscoverTools(active)) {
            JSONValue schema = t.parameters ? t.parameters->ToJsonSchema()
                                            : registry::ParameterSchema::Empty()->ToJsonSchema();
            tools.push_back(std::make_shared<JSONValue>(
                json::ObjectBuilder()
                    .Set("name", t.metadata.name)
                    .Set("description", t.metadata.description)
                    .Set("inputSchema", std::move(schema))
                    .Set("annotations", json::ObjectBuilder()
                                            .Set("category", t.metadata.category)
                                            .Set("version", t.metadata.version)
                                            .Set("tags", t.metadata.tags)
                                            .Build())
                    .Build()));
        }
        return std::make_unique<JSONRPCResponse>(
            req.id, json::ObjectBuilder().Set("tools", JSONValue(std::move(tools))).Build());
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req) {
        const JSONValue params = req.params.value_or(json::EmptyObject());
        const std::optional<std::string> name = json::GetString(params, "name");
        if (!name || name->empty()) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
        }
        LOG_DEBUG("Handling tools/call request for '{}'", *name);
        const JSONValue* argsPtr = json::Find(params, "arguments");
        const JSONValue arguments = argsPtr != nullptr ? *argsPtr : json::EmptyObject();

        // The registry may change between dispatch and lookup; callTool is the single lookup.
        std::optional<ToolOutcome> called;
        try {
            called.emplace(callTool(*name, arguments));
        } catch (const errors::NotFoundError&) {
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + *name);
        }
        ToolOutcome& outcome = *called;

        json::ObjectBuilder result;
        JSONValue payload;
        if (const auto* ok = std::get_if<errors::ToolSuccess>(&outcome)) {
            payload = ok->result;
            result.Set("isError", false);
        } else {
            payload = errors::FailureEnvelope(std::get<ToolFailure>(outcome));
            result.Set("isError", true);
        }
        const std::string text = payload.IsString() ? std::get<std::string>(payload.value) : SerializeJSON(payload);
        JSONValue::Array content;
        content.push_back(std::make_shared<JSONValue>(
            json::ObjectBuilder().Set("type", "text").Set("text", text).Build()));
        result.Set("content", JSONValue(std::move(content)));
        if (payload.IsObject()) {
            result.Set("structuredContent", payload);
        }
        return std::make_unique<JSONRPCResponse>(req.id, result.Build());
    }

    std::unique_ptr<JSONRPCResponse> handleRequest(const JSONRPCRequest& req) {
        try {
            if (req.method == "initialize") return handleInitialize(req);
            if (req.method == "ping") return std::make_unique<JSONRPCResponse>(req.id, json::EmptyObject());
            if (req.method == "tools/list") return handleToolsList(req);
            if (req.method == "tools/call") return handleToolsCall(req);
            LOG_DEBUG("Unknown method '{}'", req.method);
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        } catch (const std::exception& e) {
            LOG_ERROR("Request '{}' failed: {}", req.method, e.what());
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
        }
    }

    void handleNotification(std::unique_ptr<JSONRPCNotification> n) {
        if (!n) return;
        if (n->method == "notifications/initialized") {
            LOG_DEBUG("Client initialized");
        } else {
            LOG_DEBUG("Ignoring notification '{}'", n->method);
        }
    }
};

ToolServer::ToolServer(ServerConfig config, ServerContext& context, TransportFactory transportFactory) {
    ValidateServerConfig(config);
    pImpl = std::make_unique<Impl>(std::move(config), context, std::move(transportFactory));
    pImpl->probeSource = this;
    LOG_INFO("Server '{}' v{} created", pImpl->config.name, pImpl->config.version);
}

ToolServer::~ToolServer() {
    try {
        pImpl->stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Server stop during destruction failed: {}", e.what());
    }
    pImpl->probes.reset();
}

std::future<void> ToolServer::Start() {
    std::promise<void> done;
    auto fut = done.get_future();
    try {
        pImpl->start();
        done.set_value();
    } catch (const std::exception&) {
        done.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> ToolServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    try {
        pImpl->stop();
        done.set_value();
    } catch (const std::exception&) {
        done.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> ToolServer::Restart() {
    std::promise<void> done;
    auto fut = done.get_future();
    try {
        pImpl->restart(std::stop_token{});
        done.set_value();
    } catch (const std::exception&) {
        done.set_exception(std::current_exception());
    }
    return fut;
}

void ToolServer::ScheduleRestart() {
    Impl* impl = pImpl.get();
    std::jthread previous;
    {
        std::lock_guard<std::mutex> lock(impl->workerMutex);
        if (impl->restartInProgress.exchange(true)) {
            LOG_WARN("Restart already in progress");
            return;
        }
        previous = std::move(impl->restartThread);
        impl->restartThread = std::jthread([impl](std::stop_token st) {
            // Lets the response to the triggering call be written before the transport goes down.
            if (!impl->sleepFor(st, std::chrono::milliseconds(100))) {
                impl->restartInProgress = false;
                return;
            }
            try {
                impl->restart(st);
            } catch (const std::exception& e) {
                LOG_ERROR("Scheduled restart failed: {}", e.what());
            }
            impl->restartInProgress = false;
        });
    }
    if (previous.joinable()) {
        previous.join();
    }
}

bool ToolServer::IsRunning() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->isRunning;
}

ServerState ToolServer::State() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->state;
}

void ToolServer::ResetErrors() {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->consecutiveErrors = 0;
    pImpl->recoveryAttempts = 0;
    pImpl->lastError.reset();
    if (pImpl->state == ServerState::Error) {
        pImpl->transition(pImpl->isRunning ? ServerState::Running : ServerState::Stopped);
    }
    LOG_INFO("Error counters and recovery attempts reset");
}

bool ToolServer::SetHealthMonitoringEnabled(bool enabled) {
    pImpl->monitoringEnabled = enabled;
    if (enabled) {
        if (IsRunning()) {
            pImpl->monitor.Start();
        }
    } else {
        pImpl->monitor.Stop();
    }
    return pImpl->monitor.IsRunning();
}

bool ToolServer::IsHealthMonitoringEnabled() const {
    return pImpl->monitor.IsRunning();
}

void ToolServer::AddHealthCheck(const std::string& name, HealthMonitor::CheckFn check) {
    pImpl->monitor.AddCheck(name, std::move(check));
}

HealthReport ToolServer::RunHealthCheck() {
    return pImpl->monitor.RunOnce();
}

void ToolServer::RegisterTool(const registry::ToolMetadata& metadata,
                              std::shared_ptr<const registry::IParameterContract> parameters,
                              ToolHandler handler,
                              const registry::RegistrationOptions& options) {
    if (!parameters) parameters = registry::ParameterSchema::Empty();
    registry::ToolInvoker invoker = pImpl->wrapper.Wrap(metadata.name, parameters, std::move(handler));
    try {
        pImpl->context.registry.RegisterTool(metadata, parameters, std::move(invoker), options);
    } catch (const std::exception& e) {
        pImpl->context.errorHandler.HandleError(e, metadata.name, "register");
        throw;
    }
    pImpl->invalidateDiscovery();
}

void ToolServer::RegisterTool(const std::string& name, const std::string& description,
                              std::shared_ptr<const registry::IParameterContract> parameters,
                              ToolHandler handler) {
    registry::ToolMetadata metadata;
    metadata.name = name;
    metadata.description = description;
    metadata.version = "1.0.0";
    metadata.category = "legacy";
    metadata.tags = {"legacy"};
    metadata.author = kFrameworkName;

    registry::RegistrationOptions options;
    options.replaceExisting = true;
    options.validateOnRegistration = false;
    RegisterTool(metadata, std::move(parameters), std::move(handler), options);
}

void ToolServer::SetToolActive(const std::string& name, bool isActive) {
    pImpl->context.registry.SetToolActive(name, isActive);
    pImpl->invalidateDiscovery();
}

void ToolServer::UpdateToolMetadata(const std::string& name, const registry::ToolMetadataPatch& patch) {
    pImpl->context.registry.UpdateToolMetadata(name, patch);
    pImpl->invalidateDiscovery();
}

void ToolServer::UnregisterTool(const std::string& name) {
    pImpl->context.registry.UnregisterTool(name);
    pImpl->invalidateDiscovery();
}

errors::ToolOutcome ToolServer::CallTool(const std::string& name, const JSONValue& arguments) {
    return pImpl->callTool(name, arguments);
}

std::unique_ptr<JSONRPCResponse> ToolServer::HandleRequest(const JSONRPCRequest& request) {
    return pImpl->handleRequest(request);
}

void ToolServer::HandleNotification(std::unique_ptr<JSONRPCNotification> notification) {
    pImpl->handleNotification(std::move(notification));
}

void ToolServer::SetTransportErrorHandler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lock(pImpl->transportErrorMutex);
    pImpl->transportErrorHandler = std::move(handler);
}

void ToolServer::HandleServerError(const std::exception& error, const std::string& operation) {
    pImpl->handleServerError(error, operation);
}

uint16_t ToolServer::ProbePort() const {
    return pImpl->probes ? pImpl->probes->BoundPort() : 0;
}

JSONValue ToolServer::GetDetailedHealth() const {
    const ServerStatus s = GetStatus();
    const registry::RegistryHealth rh = GetRegistryHealth();
    return json::ObjectBuilder()
        .Set("status", registry::toString(OverallHealth(s, rh)))
        .Set("server", s.ToJSON())
        .Set("registry", json::ObjectBuilder()
                             .Set("health", rh.ToJSON())
                             .Set("statistics", s.tools.ToJSON())
                             .Set("categories", pImpl->context.registry.GetCategories())
                             .Set("tags", pImpl->context.registry.GetTags())
                             .Build())
        .Set("circuitBreakers", pImpl->context.errorHandler.CircuitBreakerStatesJSON())
        .Set("cache", GetCacheHealth().ToJSON())
        .Set("performance", processMetrics())
        .Set("timestamp", json::Now())
        .Build();
}

ServerContext& ToolServer::Context() const {
    return pImpl->context;
}

ExecutionWrapper& ToolServer::Wrapper() const {
    return pImpl->wrapper;
}

ServerStatus ToolServer::GetStatus() const {
    return pImpl->status();
}

registry::RegistryHealth ToolServer::GetRegistryHealth() const {
    return pImpl->context.registry.GetHealthStatus();
}

cache::CacheHealth ToolServer::GetCacheHealth() const {
    return pImpl->context.cache.Health();
}

JSONValue ToolServer::GetDiagnostics() const {
    return json::ObjectBuilder()
        .Set("usage", pImpl->context.registry.GetUsageStatistics().ToJSON())
        .Set("circuitBreakers", pImpl->context.errorHandler.CircuitBreakerStatesJSON())
        .Set("categories", pImpl->context.registry.GetCategories())
        .Set("tags", pImpl->context.registry.GetTags())
        .Set("configuration", pImpl->config.SummaryJSON())
        .Set("cache", GetCacheHealth().ToJSON())
        .Set("performance", processMetrics())
        .Build();
}

const ServerConfig& ToolServer::Config() const {
    return pImpl->config;
}

} // namespace server
} // namespace toolhost
