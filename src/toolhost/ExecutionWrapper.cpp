//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionWrapper.cpp
// Purpose: ExecutionWrapper implementation
//==========================================================================================================

#include "toolhost/ExecutionWrapper.hpp"
#include "logging/Logger.h"

#include <thread>

namespace toolhost {

using errors::ErrorKind;
using errors::ToolFailure;
using errors::ToolOutcome;
using errors::ToolSuccess;

ToolHandler MakeSyncHandler(std::function<JSONValue(const JSONValue&)> fn) {
    return [fn = std::move(fn)](const JSONValue& params, std::stop_token) {
        std::promise<JSONValue> p;
        try {
            p.set_value(fn(params));
        } catch (...) {
            p.set_exception(std::current_exception());
        }
        return p.get_future();
    };
}

ToolHandler MakeAsyncHandler(std::function<JSONValue(const JSONValue&, std::stop_token)> fn) {
    return [fn = std::move(fn)](const JSONValue& params, std::stop_token stop) {
        return std::async(std::launch::async, fn, params, stop);
    };
}

ExecutionWrapper::ExecutionWrapper(registry::ToolRegistry& registry, errors::ErrorHandler& errorHandler,
                                   std::chrono::milliseconds timeout)
    : registry_(registry),
      errorHandler_(errorHandler),
      timeoutMs_(std::make_shared<std::atomic<int64_t>>(timeout.count())) {}

void ExecutionWrapper::SetTimeout(std::chrono::milliseconds timeout) {
    timeoutMs_->store(timeout.count());
}

std::chrono::milliseconds ExecutionWrapper::Timeout() const {
    return std::chrono::milliseconds(timeoutMs_->load());
}

ErrorKind ExecutionWrapper::KindOf(const std::exception& e) {
    if (dynamic_cast<const errors::ParameterValidationError*>(&e) != nullptr) return ErrorKind::Validation;
    if (dynamic_cast<const errors::TimeoutError*>(&e) != nullptr) return ErrorKind::Timeout;
    if (dynamic_cast<const errors::CircuitOpenError*>(&e) != nullptr) return ErrorKind::CircuitOpen;
    if (dynamic_cast<const errors::NotFoundError*>(&e) != nullptr) return ErrorKind::NotFound;
    if (dynamic_cast<const errors::ConfigurationError*>(&e) != nullptr) return ErrorKind::Configuration;
    return ErrorKind::Execution;
}

registry::ToolInvoker ExecutionWrapper::Wrap(const std::string& toolName,
                                             std::shared_ptr<const registry::IParameterContract> contract,
                                             ToolHandler handler) const {
    registry::ToolRegistry* reg = &registry_;
    errors::ErrorHandler* eh = &errorHandler_;
    auto timeoutMs = timeoutMs_;
    if (!contract) contract = registry::ParameterSchema::Empty();

    return [reg, eh, timeoutMs, toolName, contract, handler](const JSONValue& params) -> ToolOutcome {
        const std::string breakerKey = BreakerKey(toolName);
        ToolOutcome outcome;

        registry::ParameterValidation pv = contract->Validate(params);
        if (!pv.ok) {
            errors::ParameterValidationError err(pv.issues);
            outcome = ToolFailure{ErrorKind::Validation, eh->HandleError(err, toolName, "validate", breakerKey)};
            reg->RecordToolUsage(toolName);
            return outcome;
        }

        std::function<ToolOutcome()> op = [&]() -> ToolOutcome {
            std::stop_source stopSource;
            std::future<JSONValue> fut = handler(params, stopSource.get_token());
            const auto budget = std::chrono::milliseconds(timeoutMs->load());
            if (fut.wait_for(budget) == std::future_status::timeout) {
                stopSource.request_stop();
                // The late result is discarded; the waiter keeps the shared state alive until it settles.
                std::thread([f = std::move(fut)]() mutable { f.wait(); }).detach();
                throw errors::TimeoutError("Tool '" + toolName + "' timed out after " +
                                           std::to_string(budget.count()) + "ms");
            }
            return ToolSuccess{fut.get()};
        };

        std::function<ToolOutcome()> fallback = [&]() -> ToolOutcome {
            errors::CircuitOpenError err("Tool " + toolName + " is currently unavailable due to repeated failures");
            return ToolFailure{ErrorKind::CircuitOpen, eh->HandleError(err, toolName, "execute", breakerKey)};
        };

        try {
            outcome = eh->WithBreaker<ToolOutcome>(breakerKey, op, fallback);
        } catch (const std::exception& e) {
            outcome = ToolFailure{KindOf(e), eh->HandleError(e, toolName, "execute", breakerKey)};
        } catch (...) {
            outcome = ToolFailure{ErrorKind::Execution,
                                  eh->HandleError(std::current_exception(), toolName, "execute", breakerKey)};
        }

        reg->RecordToolUsage(toolName);
        return outcome;
    };
}

} // namespace toolhost
