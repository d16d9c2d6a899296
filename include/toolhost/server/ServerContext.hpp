//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerContext.hpp
// Purpose: The per-process collaborators shared by the lifecycle controller, wrapper and tools
//==========================================================================================================

#pragma once

#include "toolhost/ServerConfig.h"
#include "toolhost/cache/CacheManager.hpp"
#include "toolhost/errors/ErrorHandler.hpp"
#include "toolhost/registry/ToolRegistry.hpp"

namespace toolhost {
namespace server {

//==========================================================================================================
// ServerContext
// Purpose: Owns the one registry, error handler and cache of a process. Constructed once at startup
//          and passed by reference to everything that needs it.
//==========================================================================================================
struct ServerContext {
    explicit ServerContext(errors::ErrorHandlerConfig errorConfig = {}, cache::CacheConfig cacheConfig = {})
        : errorHandler(errorConfig), cache(cacheConfig) {}

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    registry::ToolRegistry registry;
    errors::ErrorHandler errorHandler;
    cache::CacheManager cache;
};

// Error handler settings derived from the server configuration (logging switch, retry ceiling).
inline errors::ErrorHandlerConfig MakeErrorHandlerConfig(const ServerConfig& config) {
    errors::ErrorHandlerConfig out;
    out.logErrors = config.errorHandling.logErrors;
    out.retry.maxAttempts = config.lifecycle.maxRetries + 1;
    return out;
}

} // namespace server
} // namespace toolhost
