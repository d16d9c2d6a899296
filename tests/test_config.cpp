//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: Configuration defaults, layering (file, environment, overrides) and validation tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

#include "toolhost/ConfigLoader.hpp"
#include "toolhost/JSONHelpers.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }
private:
    const char* name_;
};

std::string writeTempConfig(const std::string& content) {
    char path[] = "/tmp/toolhost_config_XXXXXX";
    int fd = ::mkstemp(path);
    EXPECT_GE(fd, 0);
    ::close(fd);
    std::ofstream out(path);
    out << content;
    return path;
}

bool mentions(const std::vector<std::string>& problems, const std::string& text) {
    for (const auto& p : problems) {
        if (p.find(text) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST(ServerConfigTest, DefaultsAreValid) {
    ServerConfig c;
    EXPECT_TRUE(CollectConfigProblems(c).empty());
    EXPECT_EQ(c.transport.type, TransportType::Stdio);
    EXPECT_EQ(c.lifecycle.startupTimeout, 30000);
    EXPECT_EQ(c.lifecycle.shutdownTimeout, 15000);
    EXPECT_EQ(c.lifecycle.healthCheckInterval, 30000);
    EXPECT_EQ(c.lifecycle.maxRetries, 3);
    EXPECT_EQ(c.errorHandling.maxConsecutiveErrors, 5);
    EXPECT_EQ(c.healthCheck.endpoints.health, "/health");
    EXPECT_EQ(c.EffectiveHealthPort(), 3002);
}

TEST(ServerConfigTest, HealthPortDefaultsToTransportPortPlusOne) {
    ServerConfig c;
    c.transport.port = 8080;
    EXPECT_EQ(c.EffectiveHealthPort(), 8081);
    c.healthCheck.port = 9000;
    EXPECT_EQ(c.EffectiveHealthPort(), 9000);
}

TEST(ServerConfigTest, ValidationReportsEveryProblem) {
    ServerConfig c;
    c.name = " ";
    c.version = "1.0";
    c.transport.type = TransportType::HttpStream;
    c.lifecycle.startupTimeout = 100;
    c.lifecycle.healthCheckInterval = 500;
    c.errorHandling.errorRecoveryDelay = 10;
    c.healthCheck.port = 80;

    auto problems = CollectConfigProblems(c);
    EXPECT_TRUE(mentions(problems, "Server name is required"));
    EXPECT_TRUE(mentions(problems, "semantic versioning"));
    EXPECT_TRUE(mentions(problems, "Port is required for httpStream transport"));
    EXPECT_TRUE(mentions(problems, "Startup timeout must be at least 5000ms"));
    EXPECT_TRUE(mentions(problems, "Health check interval must be at least 10000ms"));
    EXPECT_TRUE(mentions(problems, "Error recovery delay must be at least 1000ms"));
    EXPECT_TRUE(mentions(problems, "Health check port must be between 1024 and 65535"));

    try {
        ValidateServerConfig(c);
        FAIL() << "expected ConfigurationError";
    } catch (const errors::ConfigurationError& e) {
        EXPECT_EQ(e.problems().size(), problems.size());
        EXPECT_EQ(std::string(e.what()).rfind("Invalid server configuration: ", 0), 0u);
    }
}

TEST(ServerConfigTest, DisabledHealthCheckSkipsPortCheck) {
    ServerConfig c;
    c.healthCheck.enabled = false;
    c.healthCheck.port = 1;
    EXPECT_TRUE(CollectConfigProblems(c).empty());
}

TEST(ServerConfigTest, HttpsRequiresCertificateFiles) {
    ServerConfig c;
    c.transport.type = TransportType::HttpStream;
    c.transport.port = 8443;
    c.transport.scheme = "https";
    EXPECT_TRUE(mentions(CollectConfigProblems(c), "https transport requires certFile and keyFile"));
}

TEST(ConfigLoaderTest, ApplyJSONMergesPresentFields) {
    ServerConfig c;
    ConfigLoader::ApplyJSON(c, ParseJSON(R"({
        "name": "demo",
        "transport": {"type": "httpStream", "port": 8080, "endpoint": "/rpc"},
        "lifecycle": {"maxRetries": 5},
        "errorHandling": {"enableRecovery": false},
        "healthCheck": {"endpoints": {"ready": "/readyz"}},
        "logging": {"level": "debug", "filePath": "/tmp/toolhost.log"}
    })"));

    EXPECT_EQ(c.name, "demo");
    EXPECT_EQ(c.version, "1.0.0");
    EXPECT_EQ(c.transport.type, TransportType::HttpStream);
    ASSERT_TRUE(c.transport.port.has_value());
    EXPECT_EQ(*c.transport.port, 8080);
    EXPECT_EQ(c.transport.endpoint, "/rpc");
    EXPECT_EQ(c.lifecycle.maxRetries, 5);
    EXPECT_EQ(c.lifecycle.retryDelay, 5000);
    EXPECT_FALSE(c.errorHandling.enableRecovery);
    EXPECT_EQ(c.healthCheck.endpoints.ready, "/readyz");
    EXPECT_EQ(c.healthCheck.endpoints.live, "/live");
    EXPECT_EQ(c.logging.level, "debug");
    ASSERT_TRUE(c.logging.filePath.has_value());
}

TEST(ConfigLoaderTest, ApplyJSONRejectsWrongTypes) {
    ServerConfig c;
    EXPECT_THROW(ConfigLoader::ApplyJSON(c, ParseJSON(R"({"lifecycle":{"maxRetries":"three"}})")),
                 errors::ConfigurationError);
    EXPECT_THROW(ConfigLoader::ApplyJSON(c, ParseJSON(R"({"transport":{"type":"carrier-pigeon"}})")),
                 errors::ConfigurationError);
    EXPECT_THROW(ConfigLoader::ApplyJSON(c, ParseJSON(R"({"healthCheck":true})")), errors::ConfigurationError);
}

TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
    const std::string path = writeTempConfig(R"({"name":"from-file","lifecycle":{"retryDelay":2000}})");
    ScopedEnv name("MCP_SERVER_NAME", "from-env");
    ScopedEnv retries("MCP_MAX_RETRIES", "7");
    ScopedEnv recovery("MCP_ENABLE_RECOVERY", "false");

    ConfigOverrides o;
    o.configPath = path;
    ServerConfig c = ConfigLoader::Load(o);
    EXPECT_EQ(c.name, "from-env");
    EXPECT_EQ(c.lifecycle.maxRetries, 7);
    EXPECT_EQ(c.lifecycle.retryDelay, 2000);
    EXPECT_FALSE(c.errorHandling.enableRecovery);
    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, OverridesWinOverEnvironment) {
    ScopedEnv level("MCP_LOG_LEVEL", "warn");
    ScopedEnv port("MCP_SERVER_PORT", "9000");

    ServerConfig c;
    ConfigLoader::ApplyEnvironment(c);
    EXPECT_EQ(c.logging.level, "warn");

    ConfigOverrides o;
    o.transport = "httpStream";
    o.port = 9100;
    o.healthPort = 9200;
    o.logLevel = "debug";
    ConfigLoader::ApplyOverrides(c, o);
    EXPECT_EQ(c.transport.type, TransportType::HttpStream);
    EXPECT_EQ(*c.transport.port, 9100);
    EXPECT_EQ(c.EffectiveHealthPort(), 9200);
    EXPECT_EQ(c.logging.level, "debug");
}

TEST(ConfigLoaderTest, MalformedEnvironmentValueIsConfigurationError) {
    ScopedEnv bad("MCP_STARTUP_TIMEOUT", "soon");
    ServerConfig c;
    EXPECT_THROW(ConfigLoader::ApplyEnvironment(c), errors::ConfigurationError);
}

TEST(ConfigLoaderTest, LoadValidatesResult) {
    const std::string path = writeTempConfig(R"({"lifecycle":{"startupTimeout":10}})");
    ConfigOverrides o;
    o.configPath = path;
    EXPECT_THROW(ConfigLoader::Load(o), errors::ConfigurationError);
    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, ReadFileErrors) {
    EXPECT_THROW(ConfigLoader::ReadFile("/nonexistent/toolhost.json"), errors::ConfigurationError);

    const std::string path = writeTempConfig("{ not json");
    EXPECT_THROW(ConfigLoader::ReadFile(path), errors::ConfigurationError);
    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, SummaryOmitsTlsFiles) {
    ServerConfig c;
    c.transport.type = TransportType::HttpStream;
    c.transport.port = 8443;
    c.transport.scheme = "https";
    c.transport.keyFile = "/secret/key.pem";
    const std::string summary = SerializeJSON(c.SummaryJSON());
    EXPECT_EQ(summary.find("/secret/key.pem"), std::string::npos);
    EXPECT_NE(summary.find("httpStream"), std::string::npos);
}
