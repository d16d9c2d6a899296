//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_system_tools.cpp
// Purpose: Built-in system tools and JSON-RPC dispatch through ToolServer
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "toolhost/JSONHelpers.h"
#include "toolhost/server/ToolServer.hpp"
#include "toolhost/tools/SystemTools.hpp"

using namespace toolhost;
using namespace toolhost::server;
using namespace std::chrono_literals;

namespace {

class CountingAcceptor : public transport::ITransportAcceptor {
public:
    explicit CountingAcceptor(std::shared_ptr<std::atomic<int>> starts) : starts_(std::move(starts)) {}

    std::future<void> Start() override {
        ++*starts_;
        return ready();
    }
    std::future<void> Stop() override { return ready(); }
    void SetRequestHandler(RequestHandler) override {}
    void SetNotificationHandler(NotificationHandler) override {}
    void SetErrorHandler(ErrorHandler) override {}
    std::size_t ActiveSessions() const override { return 1; }

private:
    static std::future<void> ready() {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    std::shared_ptr<std::atomic<int>> starts_;
};

class SystemToolsTest : public ::testing::Test {
protected:
    SystemToolsTest() : starts(std::make_shared<std::atomic<int>>(0)) {
        ServerConfig cfg;
        cfg.name = "tools-test";
        cfg.version = "2.1.0";
        cfg.lifecycle.recoveryGracePeriod = 0;
        cfg.errorHandling.logErrors = false;
        cfg.healthCheck.enabled = false;
        auto counter = starts;
        server = std::make_unique<ToolServer>(cfg, context, [counter](const ServerConfig&) {
            return std::make_unique<CountingAcceptor>(counter);
        });
        tools::RegisterSystemTools(*server);
        server->Start().get();
    }

    JSONValue callOk(const std::string& name, const JSONValue& args = json::EmptyObject()) {
        errors::ToolOutcome out = server->CallTool(name, args);
        if (!errors::IsSuccess(out)) {
            ADD_FAILURE() << name << " failed: " << std::get<errors::ToolFailure>(out).error.message;
            return json::EmptyObject();
        }
        return std::get<errors::ToolSuccess>(out).result;
    }

    errors::ToolFailure callFail(const std::string& name, const JSONValue& args) {
        errors::ToolOutcome out = server->CallTool(name, args);
        EXPECT_FALSE(errors::IsSuccess(out)) << name << " unexpectedly succeeded";
        if (errors::IsSuccess(out)) return errors::ToolFailure{};
        return std::get<errors::ToolFailure>(out);
    }

    JSONValue rpc(const std::string& method, const JSONValue& params) {
        JSONRPCRequest req(JSONRPCId{int64_t{1}}, method, params);
        std::unique_ptr<JSONRPCResponse> res = server->HandleRequest(req);
        if (!res) {
            ADD_FAILURE() << method << " produced no response";
            return json::EmptyObject();
        }
        return ParseJSON(res->Serialize());
    }

    ServerContext context;
    std::shared_ptr<std::atomic<int>> starts;
    std::unique_ptr<ToolServer> server;
};

std::vector<std::string> toolNames(const JSONValue& discovery) {
    std::vector<std::string> names;
    if (const JSONValue::Array* arr = json::GetArray(discovery, "tools")) {
        for (const auto& t : *arr) {
            names.push_back(json::GetString(*t, "name").value_or(""));
        }
    }
    return names;
}

} // namespace

TEST_F(SystemToolsTest, AllSystemToolsRegistered) {
    for (const auto& name : tools::SystemToolNames()) {
        EXPECT_TRUE(context.registry.HasTool(name)) << name;
    }
    EXPECT_EQ(context.registry.GetCategories(), (std::vector<std::string>{"registry", "system"}));
    EXPECT_THROW(tools::RegisterSystemTools(*server), errors::RegistrationError);
}

TEST_F(SystemToolsTest, HealthCheckBasicAndDetailed) {
    JSONValue basic = callOk("health_check");
    EXPECT_EQ(json::GetString(basic, "status").value_or(""), "healthy");
    EXPECT_EQ(json::GetString(basic, "server").value_or(""), "tools-test");
    EXPECT_EQ(json::GetString(basic, "serverState").value_or(""), "running");
    EXPECT_FALSE(json::Has(basic, "detailed"));
    const JSONValue* reg = json::Find(basic, "toolRegistry");
    ASSERT_NE(reg, nullptr);
    EXPECT_EQ(json::GetInt(*reg, "totalTools").value_or(0), 7);

    JSONValue detailed = callOk("health_check", json::ObjectBuilder().Set("detailed", true).Build());
    const JSONValue* d = json::Find(detailed, "detailed");
    ASSERT_NE(d, nullptr);
    EXPECT_TRUE(json::Has(*d, "configuration"));
    EXPECT_TRUE(json::Has(*d, "circuitBreakers"));
    EXPECT_TRUE(json::Has(*d, "cache"));
}

TEST_F(SystemToolsTest, ServerInfoReportsCapabilities) {
    JSONValue info = callOk("server_info");
    const JSONValue* srv = json::Find(info, "server");
    ASSERT_NE(srv, nullptr);
    EXPECT_EQ(json::GetString(*srv, "version").value_or(""), "2.1.0");
    const JSONValue* caps = json::Find(info, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_TRUE(json::GetBool(*caps, "tools").value_or(false));
    EXPECT_FALSE(json::GetBool(*caps, "resources").value_or(true));
    const JSONValue* runtime = json::Find(info, "runtime");
    ASSERT_NE(runtime, nullptr);
    EXPECT_EQ(json::GetString(*runtime, "transport").value_or(""), "stdio");
}

TEST_F(SystemToolsTest, ToolDiscoveryFilters) {
    JSONValue all = callOk("tool_discovery");
    EXPECT_EQ(json::GetInt(all, "totalFound").value_or(0), 7);

    JSONValue registryTools = callOk("tool_discovery", json::ObjectBuilder().Set("category", "registry").Build());
    EXPECT_EQ(toolNames(registryTools),
              (std::vector<std::string>{"registry_activate_tool", "registry_status", "registry_update_metadata",
                                        "tool_discovery"}));

    JSONValue byTags = callOk("tool_discovery", ParseJSON(R"({"tags":["health","monitoring"]})"));
    EXPECT_EQ(toolNames(byTags), std::vector<std::string>{"health_check"});

    JSONValue medium = callOk("tool_discovery", json::ObjectBuilder().Set("complexity", "medium").Build());
    EXPECT_EQ(toolNames(medium), std::vector<std::string>{"server_lifecycle"});

    errors::ToolFailure bad = callFail("tool_discovery", json::ObjectBuilder().Set("complexity", "extreme").Build());
    EXPECT_EQ(bad.kind, errors::ErrorKind::Validation);
}

TEST_F(SystemToolsTest, DiscoveryCacheKeepsDistinctFiltersApart) {
    // A literal "*" name matches nothing and must not be served to the unfiltered query.
    JSONValue star = callOk("tool_discovery", json::ObjectBuilder().Set("name", "*").Build());
    EXPECT_EQ(json::GetInt(star, "totalFound").value_or(-1), 0);
    JSONValue all = callOk("tool_discovery");
    EXPECT_EQ(json::GetInt(all, "totalFound").value_or(-1), 7);

    // One tag containing a comma is not the same filter as two tags.
    JSONValue joined = callOk("tool_discovery", ParseJSON(R"({"tags":["health,monitoring"]})"));
    EXPECT_EQ(json::GetInt(joined, "totalFound").value_or(-1), 0);
    JSONValue split = callOk("tool_discovery", ParseJSON(R"({"tags":["health","monitoring"]})"));
    EXPECT_EQ(toolNames(split), std::vector<std::string>{"health_check"});
}

TEST_F(SystemToolsTest, ActivationInvalidatesDiscoveryCache) {
    const JSONValue activeFilter = json::ObjectBuilder().Set("isActive", true).Build();
    EXPECT_EQ(json::GetInt(callOk("tool_discovery", activeFilter), "totalFound").value_or(0), 7);

    JSONValue res = callOk("registry_activate_tool",
                           json::ObjectBuilder().Set("toolName", "server_info").Set("isActive", false).Build());
    EXPECT_EQ(json::GetString(res, "message").value_or(""), "Tool 'server_info' deactivated successfully");

    EXPECT_EQ(json::GetInt(callOk("tool_discovery", activeFilter), "totalFound").value_or(0), 6);
    EXPECT_EQ(callFail("server_info", json::EmptyObject()).kind, errors::ErrorKind::NotFound);

    errors::ToolFailure missing = callFail("registry_activate_tool",
        json::ObjectBuilder().Set("toolName", "nope").Set("isActive", true).Build());
    EXPECT_EQ(missing.kind, errors::ErrorKind::NotFound);
}

TEST_F(SystemToolsTest, UpdateMetadataReportsFields) {
    JSONValue res = callOk("registry_update_metadata", ParseJSON(R"({
        "toolName": "health_check",
        "metadata": {"description": "Deep health", "tags": ["readiness"]}
    })"));
    EXPECT_EQ(json::GetStringList(res, "updatedFields").value_or(std::vector<std::string>{}),
              (std::vector<std::string>{"description", "tags"}));
    EXPECT_EQ(context.registry.GetTool("health_check")->metadata.description, "Deep health");
    EXPECT_EQ(context.registry.GetTool("health_check")->metadata.tags, std::vector<std::string>{"readiness"});

    errors::ToolFailure wrongType = callFail("registry_update_metadata",
        ParseJSON(R"({"toolName":"health_check","metadata":{"tags":5}})"));
    EXPECT_EQ(wrongType.kind, errors::ErrorKind::Validation);

    errors::ToolFailure missingArg = callFail("registry_update_metadata",
        ParseJSON(R"({"toolName":"health_check"})"));
    EXPECT_EQ(missingArg.kind, errors::ErrorKind::Validation);
}

TEST_F(SystemToolsTest, RegistryStatusSummaries) {
    callOk("server_info");
    JSONValue status = callOk("registry_status");
    const JSONValue* usage = json::Find(status, "usage");
    ASSERT_NE(usage, nullptr);
    EXPECT_EQ(json::GetInt(*usage, "totalUsage").value_or(0), 1);
    EXPECT_TRUE(json::Has(status, "health"));
    EXPECT_EQ(json::GetStringList(status, "categories").value_or(std::vector<std::string>{}).size(), 2u);
}

TEST_F(SystemToolsTest, LifecycleResetAndToggle) {
    server->HandleServerError(std::runtime_error("synthetic"), "test");
    EXPECT_EQ(server->GetStatus().consecutiveErrors, 1);

    JSONValue reset = callOk("server_lifecycle", json::ObjectBuilder().Set("action", "reset_errors").Build());
    EXPECT_EQ(json::GetString(reset, "serverState").value_or(""), "running");
    EXPECT_EQ(server->GetStatus().consecutiveErrors, 0);

    JSONValue off = callOk("server_lifecycle", json::ObjectBuilder()
                                                   .Set("action", "toggle_health_monitoring")
                                                   .Set("enabled", false)
                                                   .Build());
    EXPECT_FALSE(json::GetBool(off, "enabled").value_or(true));
    JSONValue toggled = callOk("server_lifecycle",
                               json::ObjectBuilder().Set("action", "toggle_health_monitoring").Build());
    EXPECT_TRUE(json::GetBool(toggled, "enabled").value_or(false));

    errors::ToolFailure bad = callFail("server_lifecycle", json::ObjectBuilder().Set("action", "explode").Build());
    EXPECT_EQ(bad.kind, errors::ErrorKind::Validation);
}

TEST_F(SystemToolsTest, LifecycleRestartIsScheduled) {
    JSONValue res = callOk("server_lifecycle", json::ObjectBuilder().Set("action", "restart").Build());
    EXPECT_EQ(json::GetString(res, "previousState").value_or(""), "running");
    EXPECT_EQ(json::GetString(res, "message").value_or(""), "Server restart scheduled");

    for (int i = 0; i < 300 && starts->load() < 2; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(starts->load(), 2);
    for (int i = 0; i < 100 && server->State() != ServerState::Running; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(server->State(), ServerState::Running);
}

TEST_F(SystemToolsTest, JsonRpcDispatch) {
    JSONValue init = rpc("initialize", json::EmptyObject());
    const JSONValue* initResult = json::Find(init, "result");
    ASSERT_NE(initResult, nullptr);
    const JSONValue* serverInfo = json::Find(*initResult, "serverInfo");
    ASSERT_NE(serverInfo, nullptr);
    EXPECT_EQ(json::GetString(*serverInfo, "name").value_or(""), "tools-test");

    EXPECT_TRUE(json::Has(rpc("ping", json::EmptyObject()), "result"));

    JSONValue list = rpc("tools/list", json::EmptyObject());
    const JSONValue* listResult = json::Find(list, "result");
    ASSERT_NE(listResult, nullptr);
    const JSONValue::Array* tools = json::GetArray(*listResult, "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_EQ(tools->size(), 7u);
    EXPECT_TRUE(json::Has(*(*tools)[0], "inputSchema"));

    JSONValue unknownMethod = rpc("resources/list", json::EmptyObject());
    EXPECT_EQ(json::GetInt(*json::Find(unknownMethod, "error"), "code").value_or(0),
              JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(SystemToolsTest, JsonRpcToolCalls) {
    JSONValue ok = rpc("tools/call", ParseJSON(R"({"name":"registry_status","arguments":{}})"));
    const JSONValue* okResult = json::Find(ok, "result");
    ASSERT_NE(okResult, nullptr);
    EXPECT_FALSE(json::GetBool(*okResult, "isError").value_or(true));
    EXPECT_TRUE(json::Has(*okResult, "structuredContent"));
    const JSONValue::Array* content = json::GetArray(*okResult, "content");
    ASSERT_NE(content, nullptr);
    ASSERT_EQ(content->size(), 1u);
    EXPECT_EQ(json::GetString(*(*content)[0], "type").value_or(""), "text");

    JSONValue failed = rpc("tools/call", ParseJSON(R"({"name":"server_lifecycle","arguments":{}})"));
    const JSONValue* failedResult = json::Find(failed, "result");
    ASSERT_NE(failedResult, nullptr);
    EXPECT_TRUE(json::GetBool(*failedResult, "isError").value_or(false));
    const JSONValue* envelope = json::Find(*failedResult, "structuredContent");
    ASSERT_NE(envelope, nullptr);
    EXPECT_FALSE(json::GetBool(*envelope, "success").value_or(true));

    JSONValue unknown = rpc("tools/call", ParseJSON(R"({"name":"does_not_exist"})"));
    EXPECT_EQ(json::GetInt(*json::Find(unknown, "error"), "code").value_or(0), JSONRPCErrorCodes::ToolNotFound);

    JSONValue noName = rpc("tools/call", json::EmptyObject());
    EXPECT_EQ(json::GetInt(*json::Find(noName, "error"), "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(SystemToolsTest, CallAfterUnregisterIsToolNotFound) {
    server->RegisterTool("scratch", "Temporary tool", nullptr,
                         MakeSyncHandler([](const JSONValue&) { return json::ObjectBuilder().Set("ok", true).Build(); }));
    JSONValue first = rpc("tools/call", ParseJSON(R"({"name":"scratch"})"));
    const JSONValue* firstResult = json::Find(first, "result");
    ASSERT_NE(firstResult, nullptr);
    EXPECT_FALSE(json::GetBool(*firstResult, "isError").value_or(true));

    server->UnregisterTool("scratch");
    JSONValue gone = rpc("tools/call", ParseJSON(R"({"name":"scratch"})"));
    const JSONValue* err = json::Find(gone, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(json::GetInt(*err, "code").value_or(0), JSONRPCErrorCodes::ToolNotFound);
    EXPECT_THROW(server->CallTool("scratch", json::EmptyObject()), errors::NotFoundError);
}
