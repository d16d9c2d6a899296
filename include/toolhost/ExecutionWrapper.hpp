//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionWrapper.hpp
// Purpose: Turns tool handlers into invokers that validate, circuit-break, time out and never throw
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/ErrorHandler.hpp"
#include "toolhost/registry/ToolRegistry.hpp"

namespace toolhost {

//==========================================================================================================
// ToolHandler
// Purpose: The capability a tool provides: accept validated parameters and produce a result, or fail
//          by throwing. The stop token is signalled when the call's time budget runs out.
//==========================================================================================================
using ToolHandler = std::function<std::future<JSONValue>(const JSONValue& params, std::stop_token stop)>;

//==========================================================================================================
// MakeSyncHandler
// Purpose: Adapts a synchronous function; it runs on the calling thread, so the request timeout cannot
//          interrupt it. Exceptions are delivered through the returned future.
//==========================================================================================================
ToolHandler MakeSyncHandler(std::function<JSONValue(const JSONValue&)> fn);

//==========================================================================================================
// MakeAsyncHandler
// Purpose: Runs fn on its own thread so the wrapper can abandon it on timeout. fn should poll the
//          stop token and return early once stop is requested.
//==========================================================================================================
ToolHandler MakeAsyncHandler(std::function<JSONValue(const JSONValue&, std::stop_token)> fn);

//==========================================================================================================
// ExecutionWrapper
// Purpose: Builds registry invokers around tool handlers.
// Notes:
//   Each invocation runs: parameter validation, the "tool:<name>" circuit breaker (with a standardized
//   unavailable fallback), the handler raced against the request timeout, categorization of any
//   failure, and usage recording. Invokers always return a ToolOutcome.
//==========================================================================================================
class ExecutionWrapper {
public:
    ExecutionWrapper(registry::ToolRegistry& registry, errors::ErrorHandler& errorHandler,
                     std::chrono::milliseconds timeout);

    registry::ToolInvoker Wrap(const std::string& toolName,
                               std::shared_ptr<const registry::IParameterContract> contract,
                               ToolHandler handler) const;

    void SetTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds Timeout() const;

    static std::string BreakerKey(const std::string& toolName) { return "tool:" + toolName; }

    // Maps an exception type to the taxonomy kind reported to callers.
    static errors::ErrorKind KindOf(const std::exception& e);

private:
    registry::ToolRegistry& registry_;
    errors::ErrorHandler& errorHandler_;
    std::shared_ptr<std::atomic<int64_t>> timeoutMs_;
};

} // namespace toolhost
