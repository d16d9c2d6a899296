//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorHandler.cpp
// Purpose: Categorization rules, suggestions and circuit breaker bookkeeping
//==========================================================================================================

#include "toolhost/errors/ErrorHandler.hpp"
#include "toolhost/JSONHelpers.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>

namespace toolhost {
namespace errors {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

DegradationStrategy strategyFor(ErrorCategory c, ErrorSeverity s) {
    switch (c) {
        case ErrorCategory::Validation:
            return DegradationStrategy::Fail;
        case ErrorCategory::Performance:
            return s == ErrorSeverity::Critical ? DegradationStrategy::Circuit : DegradationStrategy::Retry;
        case ErrorCategory::External:
            return DegradationStrategy::Circuit;
        case ErrorCategory::RateLimit:
            return DegradationStrategy::Retry;
        case ErrorCategory::Resource:
            return DegradationStrategy::Fallback;
        case ErrorCategory::System:
            return s == ErrorSeverity::Critical ? DegradationStrategy::Fail : DegradationStrategy::Retry;
        default:
            return DegradationStrategy::Retry;
    }
}

bool isRetryable(ErrorCategory c, ErrorSeverity s, DegradationStrategy strategy) {
    if (strategy == DegradationStrategy::Fail) return false;
    if (c == ErrorCategory::Validation || c == ErrorCategory::Authorization) return false;
    if (c == ErrorCategory::System && s == ErrorSeverity::Critical) return false;
    return true;
}

std::vector<std::string> suggestionsFor(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Validation:
            return {"Check input parameters for correct format and values",
                    "Refer to tool documentation for required parameters"};
        case ErrorCategory::External:
            return {"Check network connectivity",
                    "Verify external service is available",
                    "Consider using cached data if available"};
        case ErrorCategory::Performance:
            return {"Reduce request complexity or size",
                    "Consider breaking operation into smaller chunks"};
        case ErrorCategory::RateLimit:
            return {"Implement exponential backoff for retries",
                    "Reduce request frequency"};
        case ErrorCategory::Resource:
            return {"Check if file or resource exists",
                    "Verify permissions for resource access"};
        case ErrorCategory::Authorization:
            return {"Check authentication credentials",
                    "Verify required permissions are granted"};
        default:
            return {};
    }
}

CategorizedError build(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& toolName, const std::string& operation) {
    CategorizedError e;
    e.category = category;
    e.severity = severity;
    e.code = MakeErrorCode(category, severity);
    e.message = message;
    e.suggestions = suggestionsFor(category);
    e.strategy = strategyFor(category, severity);
    e.retryable = isRetryable(category, severity, e.strategy);
    e.toolName = toolName;
    e.operation = operation;
    e.timestamp = std::chrono::system_clock::now();
    return e;
}

} // namespace

class ErrorHandler::Impl {
public:
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers;
};

ErrorHandler::ErrorHandler(ErrorHandlerConfig config)
    : config_(config), pImpl(std::make_unique<Impl>()) {}

ErrorHandler::~ErrorHandler() = default;

CategorizedError ErrorHandler::Categorize(const std::string& message, const std::string& toolName,
                                          const std::string& operation) const {
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Medium;

    if (contains(message, "validation") || contains(message, "invalid")) {
        category = ErrorCategory::Validation;
    } else if (contains(message, "timeout") || contains(message, "ETIMEDOUT")) {
        category = ErrorCategory::Performance;
        severity = ErrorSeverity::High;
    } else if (contains(message, "ECONNREFUSED") || contains(message, "ENOTFOUND")) {
        category = ErrorCategory::External;
        severity = ErrorSeverity::High;
    } else if (contains(message, "permission") || contains(message, "unauthorized")) {
        category = ErrorCategory::Authorization;
        severity = ErrorSeverity::High;
    } else if (contains(message, "rate limit") || contains(message, "too many requests")) {
        category = ErrorCategory::RateLimit;
    } else if (contains(message, "ENOENT") || contains(message, "not found")) {
        category = ErrorCategory::Resource;
    } else if (contains(message, "EMFILE") || contains(message, "ENOMEM")) {
        category = ErrorCategory::System;
        severity = ErrorSeverity::Critical;
    }
    return build(category, severity, message, toolName, operation);
}

CategorizedError ErrorHandler::Categorize(const std::exception& error, const std::string& toolName,
                                          const std::string& operation) const {
    const std::string message = error.what();
    if (dynamic_cast<const ParameterValidationError*>(&error) != nullptr) {
        return build(ErrorCategory::Validation, ErrorSeverity::Medium, message, toolName, operation);
    }
    if (dynamic_cast<const TimeoutError*>(&error) != nullptr) {
        return build(ErrorCategory::Performance, ErrorSeverity::High, message, toolName, operation);
    }
    if (dynamic_cast<const CircuitOpenError*>(&error) != nullptr) {
        return build(ErrorCategory::External, ErrorSeverity::High, message, toolName, operation);
    }
    if (dynamic_cast<const NotFoundError*>(&error) != nullptr) {
        return build(ErrorCategory::Resource, ErrorSeverity::Medium, message, toolName, operation);
    }
    return Categorize(message, toolName, operation);
}

CategorizedError ErrorHandler::HandleError(const std::exception& error, const std::string& toolName,
                                           const std::string& operation, const std::string& breakerKey) {
    CategorizedError e = Categorize(error, toolName, operation);
    if (e.retryable) {
        int64_t after = config_.retry.baseDelayMs;
        if (!breakerKey.empty()) {
            std::shared_ptr<CircuitBreaker> breaker;
            {
                std::lock_guard<std::mutex> lock(pImpl->mutex);
                auto it = pImpl->breakers.find(breakerKey);
                if (it != pImpl->breakers.end()) breaker = it->second;
            }
            if (breaker && breaker->State() == CircuitState::Open) {
                after = breaker->MsUntilRetry();
            }
        }
        e.retryAfterMs = after;
    }
    if (config_.logErrors) {
        logError(e);
    }
    return e;
}

CategorizedError ErrorHandler::HandleError(const std::exception_ptr& error, const std::string& toolName,
                                           const std::string& operation, const std::string& breakerKey) {
    try {
        if (error) std::rethrow_exception(error);
        return HandleError(std::runtime_error("Unknown error"), toolName, operation, breakerKey);
    } catch (const std::exception& e) {
        return HandleError(e, toolName, operation, breakerKey);
    } catch (...) {
        return HandleError(std::runtime_error("Unknown non-standard exception"), toolName, operation, breakerKey);
    }
}

void ErrorHandler::logError(const CategorizedError& e) const {
    const char* cat = toString(e.category);
    switch (e.severity) {
        case ErrorSeverity::Critical:
            LOG_ERROR("CRITICAL error [{}] in {}.{}: {}", cat, e.toolName, e.operation, e.message);
            break;
        case ErrorSeverity::High:
            LOG_ERROR("HIGH error [{}] in {}.{}: {}", cat, e.toolName, e.operation, e.message);
            break;
        case ErrorSeverity::Medium:
            LOG_WARN("MEDIUM error [{}] in {}.{}: {}", cat, e.toolName, e.operation, e.message);
            break;
        case ErrorSeverity::Low:
            LOG_INFO("LOW error [{}] in {}.{}: {}", cat, e.toolName, e.operation, e.message);
            break;
        case ErrorSeverity::Info:
            LOG_DEBUG("INFO error [{}] in {}.{}: {}", cat, e.toolName, e.operation, e.message);
            break;
    }
}

int64_t ErrorHandler::BackoffDelayMs(int attempt) const {
    const double raw = static_cast<double>(config_.retry.baseDelayMs) *
                       std::pow(config_.retry.backoffMultiplier, std::max(0, attempt - 1));
    const double capped = std::min(raw, static_cast<double>(config_.retry.maxDelayMs));
    return static_cast<int64_t>(capped);
}

std::shared_ptr<CircuitBreaker> ErrorHandler::Breaker(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->breakers.find(key);
    if (it != pImpl->breakers.end()) return it->second;
    auto breaker = std::make_shared<CircuitBreaker>(key, config_.circuitBreaker);
    pImpl->breakers.emplace(key, breaker);
    return breaker;
}

bool ErrorHandler::IsServiceAvailable(const std::string& key) {
    std::shared_ptr<CircuitBreaker> breaker;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->breakers.find(key);
        if (it == pImpl->breakers.end()) return true;
        breaker = it->second;
    }
    return breaker->State() != CircuitState::Open || breaker->MsUntilRetry() == 0;
}

std::vector<CircuitBreakerSnapshot> ErrorHandler::GetCircuitBreakerStates() const {
    std::vector<std::shared_ptr<CircuitBreaker>> all;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& kv : pImpl->breakers) all.push_back(kv.second);
    }
    std::vector<CircuitBreakerSnapshot> out;
    out.reserve(all.size());
    for (const auto& b : all) out.push_back(b->Snapshot());
    return out;
}

JSONValue ErrorHandler::CircuitBreakerStatesJSON() const {
    json::ObjectBuilder b;
    for (const auto& s : GetCircuitBreakerStates()) {
        b.Set(s.key, s.ToJSON());
    }
    return b.Build();
}

bool ErrorHandler::ResetCircuitBreaker(const std::string& key) {
    std::shared_ptr<CircuitBreaker> breaker;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->breakers.find(key);
        if (it == pImpl->breakers.end()) return false;
        breaker = it->second;
    }
    breaker->Reset();
    return true;
}

} // namespace errors
} // namespace toolhost
