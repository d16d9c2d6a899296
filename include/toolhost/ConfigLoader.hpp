//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigLoader.hpp
// Purpose: Layered configuration loading: defaults < JSON file < MCP_* environment < command line
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"

namespace toolhost {

//==========================================================================================================
// ConfigOverrides
// Purpose: Command-line values; each set field wins over every other source.
//==========================================================================================================
struct ConfigOverrides {
    std::optional<std::string> configPath;
    std::optional<std::string> transport;
    std::optional<int> port;
    std::optional<int> healthPort;
    std::optional<std::string> logLevel;
};

class ConfigLoader {
public:
    //==========================================================================================================
    // Load
    // Purpose: Builds and validates the effective configuration.
    // Args:
    //   overrides: Command-line values. configPath selects the file; otherwise the first existing of
    //              mcp-server.json and .mcp-server.json in the working directory is used (if any).
    // Returns:
    //   A validated ServerConfig.
    // Notes:
    //   Throws errors::ConfigurationError for unreadable files, malformed JSON, unparseable environment
    //   values or any violated invariant.
    //==========================================================================================================
    static ServerConfig Load(const ConfigOverrides& overrides = {});

    // Merges the fields present in a configuration document into config.
    static void ApplyJSON(ServerConfig& config, const JSONValue& doc);

    // Merges MCP_* environment variables into config.
    static void ApplyEnvironment(ServerConfig& config);

    static void ApplyOverrides(ServerConfig& config, const ConfigOverrides& overrides);

    // Reads and parses a JSON file; throws errors::ConfigurationError on failure.
    static JSONValue ReadFile(const std::string& path);

    // The file Load would read without an explicit path, if any exists.
    static std::optional<std::string> DiscoverConfigFile();
};

} // namespace toolhost
