//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Tool server executable: configuration, system tools, signal handling and graceful shutdown
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "toolhost/ConfigLoader.hpp"
#include "toolhost/JSONHelpers.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/server/ToolServer.hpp"
#include "toolhost/tools/SystemTools.hpp"
#include "toolhost/version.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace toolhost;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static std::optional<int> parsePortArg(int argc, char** argv, const std::string& key) {
    auto v = getArgValue(argc, argv, key);
    if (!v) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        int port = std::stoi(*v, &used);
        if (used != v->size()) {
            throw std::invalid_argument(*v);
        }
        return port;
    } catch (const std::exception&) {
        throw errors::ConfigurationError("Invalid value for " + key + ": '" + *v + "'");
    }
}

static void printUsage() {
    std::cout << "toolhost_server " << getVersionString() << "\n"
              << "Usage: toolhost_server [options]\n"
              << "  --config=PATH        Configuration file (default: ./mcp-server.json if present)\n"
              << "  --transport=KIND     stdio or httpStream\n"
              << "  --port=N             HTTP transport port\n"
              << "  --health-port=N      Health probe port\n"
              << "  --log-level=LEVEL    debug, info, warn or error\n";
}

static void registerEchoTool(server::ToolServer& srv) {
    registry::ToolMetadata meta;
    meta.name = "echo";
    meta.description = "Echo a message back to the caller";
    meta.version = "1.0.0";
    meta.category = "utility";
    meta.tags = {"demo", "echo"};

    auto schema = std::make_shared<registry::ParameterSchema>();
    schema->AddString("message", "Text to echo", true);

    srv.RegisterTool(meta, schema, MakeSyncHandler([](const JSONValue& params) {
        return json::ObjectBuilder()
            .Set("echo", json::GetString(params, "message").value_or(""))
            .Set("timestamp", json::Now())
            .Build();
    }));
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage();
        return 0;
    }

    ServerConfig config;
    try {
        ConfigOverrides overrides;
        overrides.configPath = getArgValue(argc, argv, "--config");
        overrides.transport = getArgValue(argc, argv, "--transport");
        overrides.port = parsePortArg(argc, argv, "--port");
        overrides.healthPort = parsePortArg(argc, argv, "--health-port");
        overrides.logLevel = getArgValue(argc, argv, "--log-level");
        config = ConfigLoader::Load(overrides);
    } catch (const errors::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // stdout carries protocol frames in stdio mode; logs go to stderr.
    if (config.transport.type == TransportType::Stdio) {
        ::setenv("MCP_STDIO_MODE", "1", 1);
        Logger::refreshConsoleTarget();
    }
    Logger::setLogLevelFromString(config.logging.level);
    if (config.logging.filePath) {
        Logger::setLogFile(*config.logging.filePath);
    }
    std::signal(SIGPIPE, SIG_IGN);

    LOG_INFO("Starting {} v{} ({} {})", config.name, config.version, kFrameworkName, getVersionString());

    server::ServerContext context(server::MakeErrorHandlerConfig(config));
    std::unique_ptr<server::ToolServer> srv;
    try {
        srv = std::make_unique<server::ToolServer>(config, context);
        tools::RegisterSystemTools(*srv);
        registerEchoTool(*srv);
    } catch (const std::exception& e) {
        LOG_FATAL("Failed to initialize server: {}", e.what());
        return EXIT_FAILURE;
    }

    // Completes on SIGINT/SIGTERM, or when stdin reaches EOF.
    std::promise<std::string> shutdownReason;
    std::once_flag shutdownOnce;
    auto requestShutdown = [&](const std::string& reason) {
        std::call_once(shutdownOnce, [&] { shutdownReason.set_value(reason); });
    };

    srv->SetTransportErrorHandler([&](const std::string& err) {
        if (err.find("EOF") != std::string::npos) {
            requestShutdown(err);
        }
    });

    boost::asio::io_context signalIo;
    boost::asio::signal_set signals(signalIo, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            requestShutdown(std::string("signal ") + std::to_string(signo));
        }
    });
    std::thread signalThread([&signalIo] { signalIo.run(); });

    int exitCode = EXIT_SUCCESS;
    try {
        srv->Start().get();
        LOG_INFO("Server running (transport={}, health probes {})", toString(config.transport.type),
                 srv->ProbePort() != 0 ? "on port " + std::to_string(srv->ProbePort()) : std::string("disabled"));

        const std::string reason = shutdownReason.get_future().get();
        LOG_INFO("Shutting down: {}", reason);
        srv->Stop().get();
    } catch (const std::exception& e) {
        LOG_FATAL("Server failure: {}", e.what());
        exitCode = EXIT_FAILURE;
    }

    signals.cancel();
    signalIo.stop();
    signalThread.join();
    srv.reset();
    LOG_INFO("Server exited");
    return exitCode;
}
