//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigLoader.cpp
// Purpose: ConfigLoader implementation
//==========================================================================================================

#include "toolhost/ConfigLoader.hpp"
#include "toolhost/JSONHelpers.h"
#include "toolhost/errors/Errors.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#include <fstream>
#include <limits>
#include <sstream>
#include <sys/stat.h>

namespace toolhost {

namespace {

using errors::ConfigurationError;

int64_t parseInt(const std::string& text, const std::string& source) {
    try {
        std::size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size()) throw std::invalid_argument(text);
        return static_cast<int64_t>(v);
    } catch (const std::logic_error&) {
        throw ConfigurationError(source + " must be an integer, got '" + text + "'");
    }
}

int toInt(int64_t v, const std::string& source) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigurationError(source + " is out of range");
    }
    return static_cast<int>(v);
}

bool parseBool(const std::string& text, const std::string& source) {
    if (IsTruthyEnvValue(text)) return true;
    if (IsFalsyEnvValue(text)) return false;
    throw ConfigurationError(source + " must be a boolean, got '" + text + "'");
}

bool fileExists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

// Typed readers for configuration documents; a present member of the wrong type is an error.
class Section {
public:
    Section(const JSONValue* obj, std::string path) : obj_(obj), path_(std::move(path)) {}

    bool Present() const { return obj_ != nullptr; }

    Section Child(const std::string& key) const {
        const JSONValue* v = obj_ ? json::Find(*obj_, key) : nullptr;
        if (v != nullptr && !v->IsObject()) {
            throw ConfigurationError(name(key) + " must be an object");
        }
        return Section(v, name(key));
    }

    void String(const std::string& key, std::string& out) const {
        if (const JSONValue* v = find(key)) {
            if (!v->IsString()) throw ConfigurationError(name(key) + " must be a string");
            out = std::get<std::string>(v->value);
        }
    }

    void OptString(const std::string& key, std::optional<std::string>& out) const {
        if (find(key) != nullptr) {
            std::string s;
            String(key, s);
            out = s;
        }
    }

    void Int64(const std::string& key, int64_t& out) const {
        if (find(key) != nullptr) {
            auto v = json::GetInt(*obj_, key);
            if (!v) throw ConfigurationError(name(key) + " must be an integer");
            out = *v;
        }
    }

    void Int(const std::string& key, int& out) const {
        int64_t v = out;
        Int64(key, v);
        out = toInt(v, name(key));
    }

    void OptInt(const std::string& key, std::optional<int>& out) const {
        if (find(key) != nullptr) {
            int v = 0;
            Int(key, v);
            out = v;
        }
    }

    void Bool(const std::string& key, bool& out) const {
        if (find(key) != nullptr) {
            auto b = json::GetBool(*obj_, key);
            if (!b) throw ConfigurationError(name(key) + " must be a boolean");
            out = *b;
        }
    }

private:
    const JSONValue* find(const std::string& key) const {
        if (obj_ == nullptr) return nullptr;
        const JSONValue* v = json::Find(*obj_, key);
        return (v == nullptr || v->IsNull()) ? nullptr : v;
    }

    std::string name(const std::string& key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

    const JSONValue* obj_;
    std::string path_;
};

} // namespace

JSONValue ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot open configuration file '" + path + "'");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        JSONValue doc = ParseJSON(ss.str());
        if (!doc.IsObject()) {
            throw ConfigurationError("Configuration file '" + path + "' must contain a JSON object");
        }
        return doc;
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError("Configuration file '" + path + "': " + e.what());
    }
}

std::optional<std::string> ConfigLoader::DiscoverConfigFile() {
    for (const char* candidate : {"mcp-server.json", ".mcp-server.json"}) {
        if (fileExists(candidate)) return std::string(candidate);
    }
    return std::nullopt;
}

void ConfigLoader::ApplyJSON(ServerConfig& c, const JSONValue& doc) {
    Section root(&doc, "");
    root.String("name", c.name);
    root.String("version", c.version);
    root.String("description", c.description);
    root.Int64("timeout", c.timeout);

    Section t = root.Child("transport");
    if (t.Present()) {
        std::optional<std::string> type;
        t.OptString("type", type);
        if (type) {
            auto tt = transportTypeFromString(*type);
            if (!tt) throw ConfigurationError("transport.type must be stdio or httpStream, got '" + *type + "'");
            c.transport.type = *tt;
        }
        t.String("address", c.transport.address);
        t.OptInt("port", c.transport.port);
        t.String("endpoint", c.transport.endpoint);
        std::optional<std::string> framing;
        t.OptString("framing", framing);
        if (framing) {
            auto f = stdioFramingFromString(*framing);
            if (!f) throw ConfigurationError("transport.framing must be ndjson or content-length, got '" + *framing + "'");
            c.transport.framing = *f;
        }
        t.String("scheme", c.transport.scheme);
        t.String("certFile", c.transport.certFile);
        t.String("keyFile", c.transport.keyFile);
        t.Int64("timeout", c.timeout);
    }

    Section l = root.Child("lifecycle");
    l.Int64("startupTimeout", c.lifecycle.startupTimeout);
    l.Int64("shutdownTimeout", c.lifecycle.shutdownTimeout);
    l.Int64("healthCheckInterval", c.lifecycle.healthCheckInterval);
    l.Int("maxRetries", c.lifecycle.maxRetries);
    l.Int64("retryDelay", c.lifecycle.retryDelay);
    l.Int64("recoveryGracePeriod", c.lifecycle.recoveryGracePeriod);

    Section e = root.Child("errorHandling");
    e.Bool("enableRecovery", c.errorHandling.enableRecovery);
    e.Bool("logErrors", c.errorHandling.logErrors);
    e.Int("maxConsecutiveErrors", c.errorHandling.maxConsecutiveErrors);
    e.Int64("errorRecoveryDelay", c.errorHandling.errorRecoveryDelay);

    Section h = root.Child("healthCheck");
    h.Bool("enabled", c.healthCheck.enabled);
    h.String("address", c.healthCheck.address);
    h.OptInt("port", c.healthCheck.port);
    Section ep = h.Child("endpoints");
    ep.String("health", c.healthCheck.endpoints.health);
    ep.String("ready", c.healthCheck.endpoints.ready);
    ep.String("live", c.healthCheck.endpoints.live);

    Section lg = root.Child("logging");
    lg.String("level", c.logging.level);
    lg.OptString("filePath", c.logging.filePath);
}

void ConfigLoader::ApplyEnvironment(ServerConfig& c) {
    if (auto v = GetEnvOptional("MCP_SERVER_NAME")) c.name = *v;
    if (auto v = GetEnvOptional("MCP_SERVER_VERSION")) c.version = *v;
    if (auto v = GetEnvOptional("MCP_SERVER_DESCRIPTION")) c.description = *v;
    if (auto v = GetEnvOptional("MCP_TRANSPORT_TYPE")) {
        auto tt = transportTypeFromString(*v);
        if (!tt) throw ConfigurationError("MCP_TRANSPORT_TYPE must be stdio or httpStream, got '" + *v + "'");
        c.transport.type = *tt;
    }
    if (auto v = GetEnvOptional("MCP_SERVER_PORT")) {
        c.transport.port = toInt(parseInt(*v, "MCP_SERVER_PORT"), "MCP_SERVER_PORT");
    }
    if (auto v = GetEnvOptional("MCP_TRANSPORT_ENDPOINT")) c.transport.endpoint = *v;
    if (auto v = GetEnvOptional("MCP_REQUEST_TIMEOUT")) c.timeout = parseInt(*v, "MCP_REQUEST_TIMEOUT");
    if (auto v = GetEnvOptional("MCP_STARTUP_TIMEOUT")) c.lifecycle.startupTimeout = parseInt(*v, "MCP_STARTUP_TIMEOUT");
    if (auto v = GetEnvOptional("MCP_SHUTDOWN_TIMEOUT")) c.lifecycle.shutdownTimeout = parseInt(*v, "MCP_SHUTDOWN_TIMEOUT");
    if (auto v = GetEnvOptional("MCP_HEALTH_CHECK_INTERVAL")) {
        c.lifecycle.healthCheckInterval = parseInt(*v, "MCP_HEALTH_CHECK_INTERVAL");
    }
    if (auto v = GetEnvOptional("MCP_MAX_RETRIES")) {
        c.lifecycle.maxRetries = toInt(parseInt(*v, "MCP_MAX_RETRIES"), "MCP_MAX_RETRIES");
    }
    if (auto v = GetEnvOptional("MCP_RETRY_DELAY")) c.lifecycle.retryDelay = parseInt(*v, "MCP_RETRY_DELAY");
    if (auto v = GetEnvOptional("MCP_ENABLE_RECOVERY")) {
        c.errorHandling.enableRecovery = parseBool(*v, "MCP_ENABLE_RECOVERY");
    }
    if (auto v = GetEnvOptional("MCP_LOG_ERRORS")) c.errorHandling.logErrors = parseBool(*v, "MCP_LOG_ERRORS");
    if (auto v = GetEnvOptional("MCP_MAX_CONSECUTIVE_ERRORS")) {
        c.errorHandling.maxConsecutiveErrors =
            toInt(parseInt(*v, "MCP_MAX_CONSECUTIVE_ERRORS"), "MCP_MAX_CONSECUTIVE_ERRORS");
    }
    if (auto v = GetEnvOptional("MCP_ERROR_RECOVERY_DELAY")) {
        c.errorHandling.errorRecoveryDelay = parseInt(*v, "MCP_ERROR_RECOVERY_DELAY");
    }
    if (auto v = GetEnvOptional("MCP_HEALTH_CHECK_ENABLED")) {
        c.healthCheck.enabled = parseBool(*v, "MCP_HEALTH_CHECK_ENABLED");
    }
    if (auto v = GetEnvOptional("MCP_HEALTH_CHECK_PORT")) {
        c.healthCheck.port = toInt(parseInt(*v, "MCP_HEALTH_CHECK_PORT"), "MCP_HEALTH_CHECK_PORT");
    }
    if (auto v = GetEnvOptional("MCP_LOG_LEVEL")) c.logging.level = *v;
    if (auto v = GetEnvOptional("MCP_LOG_FILE_PATH")) c.logging.filePath = *v;
}

void ConfigLoader::ApplyOverrides(ServerConfig& c, const ConfigOverrides& o) {
    if (o.transport) {
        auto tt = transportTypeFromString(*o.transport);
        if (!tt) throw ConfigurationError("--transport must be stdio or httpStream, got '" + *o.transport + "'");
        c.transport.type = *tt;
    }
    if (o.port) c.transport.port = *o.port;
    if (o.healthPort) c.healthCheck.port = *o.healthPort;
    if (o.logLevel) c.logging.level = *o.logLevel;
}

ServerConfig ConfigLoader::Load(const ConfigOverrides& overrides) {
    ServerConfig config;

    std::optional<std::string> path = overrides.configPath;
    if (!path) path = DiscoverConfigFile();
    if (path) {
        LOG_INFO("Loading configuration from {}", *path);
        ApplyJSON(config, ReadFile(*path));
    }
    ApplyEnvironment(config);
    ApplyOverrides(config, overrides);
    ValidateServerConfig(config);

    LOG_DEBUG("Effective configuration: {}", SerializeJSON(config.SummaryJSON()));
    return config;
}

} // namespace toolhost
