//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SystemTools.cpp
// Purpose: Built-in system tool definitions and handlers
//==========================================================================================================

#include "toolhost/tools/SystemTools.hpp"
#include "toolhost/JSONHelpers.h"
#include "toolhost/version.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace toolhost {
namespace tools {

using registry::Complexity;
using registry::ParameterSchema;
using registry::ResourceUsage;
using registry::ToolExample;
using registry::ToolMetadata;

namespace {

ToolMetadata makeMetadata(const std::string& name, const std::string& description, const std::string& category,
                          std::vector<std::string> tags, int64_t expectedMs, Complexity complexity,
                          ResourceUsage usage, std::vector<ToolExample> examples) {
    ToolMetadata m;
    m.name = name;
    m.description = description;
    m.version = "1.0.0";
    m.category = category;
    m.tags = std::move(tags);
    m.author = kFrameworkName;
    m.documentation = description;
    m.examples = std::move(examples);
    registry::PerformanceHints perf;
    perf.expectedResponseTime = expectedMs;
    perf.complexity = complexity;
    perf.resourceUsage = usage;
    m.performance = perf;
    return m;
}

ToolExample example(const std::string& title, const std::string& description, JSONValue input) {
    ToolExample ex;
    ex.title = title;
    ex.description = description;
    ex.input = std::move(input);
    return ex;
}

int64_t uptimeSeconds(const server::ServerStatus& s) {
    return s.uptimeMs / 1000;
}

JSONValue discoveredToolJSON(const registry::RegisteredTool& t) {
    json::ObjectBuilder b;
    b.Set("name", t.metadata.name)
     .Set("description", t.metadata.description)
     .Set("category", t.metadata.category)
     .Set("tags", t.metadata.tags)
     .Set("version", t.metadata.version)
     .Set("isActive", t.isActive)
     .Set("usageCount", t.usageCount)
     .Set("hasExamples", !t.metadata.examples.empty())
     .Set("registeredAt", json::Timestamp(t.registeredAt));
    if (t.lastUsed) {
        b.Set("lastUsed", json::Timestamp(*t.lastUsed));
    }
    if (t.metadata.performance && t.metadata.performance->complexity) {
        b.Set("complexity", registry::toString(*t.metadata.performance->complexity));
    }
    return b.Build();
}

//////////////////////////////////////////// health_check ////////////////////////////////////////////

void registerHealthCheck(server::ToolServer& srv) {
    auto schema = std::make_shared<ParameterSchema>();
    schema->AddBoolean("detailed", "Return detailed health information").Default(JSONValue(false));

    ToolMetadata meta = makeMetadata(
        "health_check", "Check the health status of the server", "system", {"health", "monitoring", "diagnostics"},
        100, Complexity::Low, ResourceUsage::Light,
        {example("Basic health check", "Get basic server health status",
                 json::ObjectBuilder().Set("detailed", false).Build()),
         example("Detailed health check", "Get comprehensive server health information",
                 json::ObjectBuilder().Set("detailed", true).Build())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, schema, MakeSyncHandler([s](const JSONValue& params) {
        const server::ServerStatus status = s->GetStatus();
        const registry::RegistryHealth rh = s->GetRegistryHealth();
        const ServerConfig& cfg = s->Config();

        json::ObjectBuilder out;
        out.Set("status", registry::toString(server::OverallHealth(status, rh)))
           .Set("server", cfg.name)
           .Set("version", cfg.version)
           .Set("uptime", uptimeSeconds(status))
           .Set("timestamp", json::Now())
           .Set("serverState", server::toString(status.state))
           .Set("consecutiveErrors", status.consecutiveErrors)
           .Set("toolRegistry", json::ObjectBuilder()
                                    .Set("status", registry::toString(rh.status))
                                    .Set("totalTools", static_cast<uint64_t>(rh.totalTools))
                                    .Set("activeTools", static_cast<uint64_t>(rh.activeTools))
                                    .Build());
        if (json::GetBool(params, "detailed").value_or(false)) {
            JSONValue detailed = s->GetDetailedHealth();
            std::get<JSONValue::Object>(detailed.value)["configuration"] =
                std::make_shared<JSONValue>(cfg.SummaryJSON());
            out.Set("detailed", std::move(detailed));
        }
        return out.Build();
    }));
}

//////////////////////////////////////////// server_info ////////////////////////////////////////////

void registerServerInfo(server::ToolServer& srv) {
    ToolMetadata meta = makeMetadata(
        "server_info", "Get comprehensive server information and capabilities", "system",
        {"info", "capabilities", "metadata"}, 50, Complexity::Low, ResourceUsage::Light,
        {example("Get server information", "Retrieve complete server information and capabilities",
                 json::EmptyObject())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, std::make_shared<ParameterSchema>(), MakeSyncHandler([s](const JSONValue&) {
        const server::ServerStatus status = s->GetStatus();
        const ServerConfig& cfg = s->Config();
        return json::ObjectBuilder()
            .Set("server", json::ObjectBuilder()
                               .Set("name", cfg.name)
                               .Set("version", cfg.version)
                               .Set("description", cfg.description)
                               .Set("framework", kFrameworkName)
                               .Set("frameworkVersion", getVersionString())
                               .Set("protocolVersion", kProtocolVersion)
                               .Build())
            .Set("capabilities", json::ObjectBuilder()
                                     .Set("tools", true)
                                     .Set("resources", false)
                                     .Set("prompts", false)
                                     .Set("logging", true)
                                     .Set("toolRegistry", true)
                                     .Set("toolDiscovery", true)
                                     .Set("healthProbes", cfg.healthCheck.enabled)
                                     .Build())
            .Set("runtime", json::ObjectBuilder()
                                .Set("uptime", uptimeSeconds(status))
                                .Set("state", server::toString(status.state))
                                .Set("activeSessions", static_cast<uint64_t>(status.activeSessions))
                                .Set("transport", toString(cfg.transport.type))
                                .Build())
            .Set("toolRegistry", status.tools.ToJSON())
            .Build();
    }));
}

//////////////////////////////////////////// tool_discovery ////////////////////////////////////////////

void registerToolDiscovery(server::ToolServer& srv) {
    auto schema = std::make_shared<ParameterSchema>();
    schema->AddString("category", "Filter by tool category")
          .AddArray("tags", "Filter by tool tags (all must match)").Items(ParameterSchema::Type::String)
          .AddString("name", "Search by tool name (partial match)")
          .AddBoolean("isActive", "Filter by active status")
          .AddBoolean("hasExamples", "Filter tools that have examples")
          .AddString("complexity", "Filter by complexity level").Enum({"low", "medium", "high"});

    ToolMetadata meta = makeMetadata(
        "tool_discovery", "Discover and search for available tools", "registry",
        {"discovery", "search", "tools", "registry"}, 200, Complexity::Low, ResourceUsage::Light,
        {example("List all tools", "Get all available tools", json::EmptyObject()),
         example("Search by category", "Find tools in a specific category",
                 json::ObjectBuilder().Set("category", "system").Build()),
         example("Search by tags", "Find tools with specific tags",
                 json::ObjectBuilder().Set("tags", std::vector<std::string>{"monitoring", "health"}).Build())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, schema, MakeSyncHandler([s](const JSONValue& params) {
        const registry::ToolFilter filter = registry::ToolFilter::FromJSON(params);
        const std::string key = filter.CacheKey();
        cache::CacheManager& cacheManager = s->Context().cache;
        if (auto cached = cacheManager.Get(cache::CacheLayer::Discovery, key)) {
            LOG_DEBUG("tool_discovery served from cache ({})", key);
            return *cached;
        }

        registry::ToolRegistry& reg = s->Context().registry;
        const auto found = reg.DiscoverTools(filter);
        JSONValue::Array tools;
        for (const auto& t : found) {
            tools.push_back(std::make_shared<JSONValue>(discoveredToolJSON(t)));
        }
        JSONValue result = json::ObjectBuilder()
            .Set("totalFound", static_cast<uint64_t>(found.size()))
            .Set("availableCategories", reg.GetCategories())
            .Set("availableTags", reg.GetTags())
            .Set("tools", JSONValue(std::move(tools)))
            .Build();
        if (!cacheManager.Set(cache::CacheLayer::Discovery, key, result)) {
            LOG_DEBUG("tool_discovery result not cached ({})", key);
        }
        return result;
    }));
}

//////////////////////////////////////////// registry_status ////////////////////////////////////////////

void registerRegistryStatus(server::ToolServer& srv) {
    ToolMetadata meta = makeMetadata(
        "registry_status", "Get comprehensive tool registry status and statistics", "registry",
        {"registry", "status", "statistics", "monitoring"}, 100, Complexity::Low, ResourceUsage::Light,
        {example("Get registry status", "Retrieve complete registry status and statistics", json::EmptyObject())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, std::make_shared<ParameterSchema>(), MakeSyncHandler([s](const JSONValue&) {
        registry::ToolRegistry& reg = s->Context().registry;
        return json::ObjectBuilder()
            .Set("health", reg.GetHealthStatus().ToJSON())
            .Set("usage", reg.GetUsageStatistics().ToJSON())
            .Set("categories", reg.GetCategories())
            .Set("tags", reg.GetTags())
            .Set("timestamp", json::Now())
            .Build();
    }));
}

//////////////////////////////////////// registry_activate_tool ////////////////////////////////////////

void registerActivateTool(server::ToolServer& srv) {
    auto schema = std::make_shared<ParameterSchema>();
    schema->AddString("toolName", "Name of the tool to activate/deactivate", true)
          .AddBoolean("isActive", "Whether to activate (true) or deactivate (false) the tool", true);

    ToolMetadata meta = makeMetadata(
        "registry_activate_tool", "Activate or deactivate a tool in the registry", "registry",
        {"registry", "management", "activation"}, 50, Complexity::Low, ResourceUsage::Light,
        {example("Activate a tool", "Enable a tool in the registry",
                 json::ObjectBuilder().Set("toolName", "health_check").Set("isActive", true).Build()),
         example("Deactivate a tool", "Disable a tool in the registry",
                 json::ObjectBuilder().Set("toolName", "health_check").Set("isActive", false).Build())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, schema, MakeSyncHandler([s](const JSONValue& params) {
        const std::string toolName = json::GetString(params, "toolName").value_or("");
        const bool isActive = json::GetBool(params, "isActive").value_or(true);
        s->SetToolActive(toolName, isActive);
        return json::ObjectBuilder()
            .Set("success", true)
            .Set("toolName", toolName)
            .Set("isActive", isActive)
            .Set("message", "Tool '" + toolName + "' " + (isActive ? "activated" : "deactivated") + " successfully")
            .Set("timestamp", json::Now())
            .Build();
    }));
}

/////////////////////////////////////// registry_update_metadata ///////////////////////////////////////

void registerUpdateMetadata(server::ToolServer& srv) {
    auto schema = std::make_shared<ParameterSchema>();
    schema->AddString("toolName", "Name of the tool to update", true)
          .AddObject("metadata", "Metadata fields to update", true);

    ToolMetadata meta = makeMetadata(
        "registry_update_metadata", "Update metadata for a tool in the registry", "registry",
        {"registry", "management", "metadata"}, 100, Complexity::Low, ResourceUsage::Light,
        {example("Update tool tags", "Add new tags to a tool",
                 json::ObjectBuilder()
                     .Set("toolName", "health_check")
                     .Set("metadata", json::ObjectBuilder()
                                          .Set("tags", std::vector<std::string>{"health", "monitoring", "system"})
                                          .Build())
                     .Build()),
         example("Update tool description", "Change tool description",
                 json::ObjectBuilder()
                     .Set("toolName", "health_check")
                     .Set("metadata", json::ObjectBuilder()
                                          .Set("description", "Enhanced health check with detailed diagnostics")
                                          .Build())
                     .Build())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, schema, MakeSyncHandler([s](const JSONValue& params) {
        const std::string toolName = json::GetString(params, "toolName").value_or("");
        const JSONValue* metadata = json::Find(params, "metadata");
        registry::ToolMetadataPatch patch;
        try {
            patch = registry::ToolMetadataPatch::FromJSON(metadata != nullptr ? *metadata : json::EmptyObject());
        } catch (const std::invalid_argument& e) {
            throw errors::ParameterValidationError({e.what()});
        }
        s->UpdateToolMetadata(toolName, patch);

        std::optional<registry::RegisteredTool> updated = s->Context().registry.GetTool(toolName);
        json::ObjectBuilder out;
        out.Set("success", true)
           .Set("toolName", toolName)
           .Set("updatedFields", patch.FieldNames())
           .Set("timestamp", json::Now());
        if (updated) {
            out.Set("currentMetadata", updated->metadata.ToJSON());
        }
        return out.Build();
    }));
}

/////////////////////////////////////////// server_lifecycle ///////////////////////////////////////////

void registerServerLifecycle(server::ToolServer& srv) {
    auto schema = std::make_shared<ParameterSchema>();
    schema->AddString("action", "Lifecycle action to perform", true)
              .Enum({"restart", "reset_errors", "toggle_health_monitoring"})
          .AddBoolean("enabled", "For toggle_health_monitoring: enable (true) or disable (false)");

    ToolMetadata meta = makeMetadata(
        "server_lifecycle", "Manage server lifecycle operations (restart, health monitoring control)", "system",
        {"lifecycle", "management", "restart", "monitoring"}, 5000, Complexity::Medium, ResourceUsage::Moderate,
        {example("Restart server", "Gracefully restart the server",
                 json::ObjectBuilder().Set("action", "restart").Build()),
         example("Reset error counters", "Reset server error counters and recovery attempts",
                 json::ObjectBuilder().Set("action", "reset_errors").Build()),
         example("Toggle health monitoring", "Enable or disable health monitoring",
                 json::ObjectBuilder().Set("action", "toggle_health_monitoring").Set("enabled", true).Build())});

    server::ToolServer* s = &srv;
    srv.RegisterTool(meta, schema, MakeSyncHandler([s](const JSONValue& params) {
        const std::string action = json::GetString(params, "action").value_or("");

        if (action == "restart") {
            const bool wasRunning = s->IsRunning();
            s->ScheduleRestart();
            return json::ObjectBuilder()
                .Set("success", true)
                .Set("action", action)
                .Set("message", "Server restart scheduled")
                .Set("previousState", wasRunning ? "running" : "stopped")
                .Set("timestamp", json::Now())
                .Build();
        }
        if (action == "reset_errors") {
            s->ResetErrors();
            return json::ObjectBuilder()
                .Set("success", true)
                .Set("action", action)
                .Set("message", "Error counters and recovery attempts reset")
                .Set("serverState", server::toString(s->State()))
                .Set("timestamp", json::Now())
                .Build();
        }
        if (action == "toggle_health_monitoring") {
            const bool wanted = json::GetBool(params, "enabled").value_or(!s->IsHealthMonitoringEnabled());
            const bool active = s->SetHealthMonitoringEnabled(wanted);
            return json::ObjectBuilder()
                .Set("success", true)
                .Set("action", action)
                .Set("enabled", active)
                .Set("interval", s->Config().lifecycle.healthCheckInterval)
                .Set("message", std::string("Health monitoring ") + (active ? "enabled" : "disabled"))
                .Set("timestamp", json::Now())
                .Build();
        }
        throw errors::ParameterValidationError({"Unknown lifecycle action '" + action + "'"});
    }));
}

} // namespace

void RegisterSystemTools(server::ToolServer& server) {
    registerHealthCheck(server);
    registerServerInfo(server);
    registerToolDiscovery(server);
    registerRegistryStatus(server);
    registerActivateTool(server);
    registerUpdateMetadata(server);
    registerServerLifecycle(server);
    LOG_INFO("Registered {} system tools", SystemToolNames().size());
}

std::vector<std::string> SystemToolNames() {
    return {"health_check", "server_info", "tool_discovery", "registry_status",
            "registry_activate_tool", "registry_update_metadata", "server_lifecycle"};
}

} // namespace tools
} // namespace toolhost
