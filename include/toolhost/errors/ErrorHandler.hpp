//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorHandler.hpp
// Purpose: Error categorization engine, per-key circuit breakers and retry with exponential backoff
//==========================================================================================================

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/errors/Errors.h"
#include "toolhost/errors/CircuitBreaker.hpp"
#include "logging/Logger.h"

namespace toolhost {
namespace errors {

//==========================================================================================================
// ErrorHandlerConfig
// Fields:
//   circuitBreaker: Thresholds shared by every breaker the handler creates.
//   retry: Attempt ceiling and backoff curve for ExecuteWithRetry.
//   enableFallbacks: When false, an open breaker throws CircuitOpenError instead of using the fallback.
//   logErrors: When false, HandleError categorizes without logging.
//==========================================================================================================
struct ErrorHandlerConfig {
    CircuitBreakerConfig circuitBreaker{};
    struct Retry {
        int maxAttempts{3};
        int64_t baseDelayMs{1000};
        int64_t maxDelayMs{30000};
        double backoffMultiplier{2.0};
    } retry{};
    bool enableFallbacks{true};
    bool logErrors{true};
};

class ErrorHandler {
public:
    explicit ErrorHandler(ErrorHandlerConfig config = {});
    ~ErrorHandler();

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    //==========================================================================================================
    // Categorize
    // Purpose: Classifies an error message by substring rules and fills strategy, retryability,
    //          code and suggestions.
    // Args:
    //   message: Error text (matched case-sensitively).
    //   toolName/operation: Call site recorded on the result.
    // Returns:
    //   CategorizedError without retryAfterMs (see HandleError).
    //==========================================================================================================
    CategorizedError Categorize(const std::string& message, const std::string& toolName,
                                const std::string& operation) const;

    //==========================================================================================================
    // Categorize (exception)
    // Notes:
    //   Typed exceptions take precedence over message rules: ParameterValidationError -> validation,
    //   TimeoutError -> performance/high, CircuitOpenError -> external/high, NotFoundError -> resource.
    //==========================================================================================================
    CategorizedError Categorize(const std::exception& error, const std::string& toolName,
                                const std::string& operation) const;

    //==========================================================================================================
    // HandleError
    // Purpose: Categorizes, logs at a level chosen by severity and computes retryAfterMs from the
    //          breaker named breakerKey (if any).
    //==========================================================================================================
    CategorizedError HandleError(const std::exception& error, const std::string& toolName,
                                 const std::string& operation, const std::string& breakerKey = {});
    CategorizedError HandleError(const std::exception_ptr& error, const std::string& toolName,
                                 const std::string& operation, const std::string& breakerKey = {});

    //==========================================================================================================
    // WithBreaker
    // Purpose: Runs op under the breaker for key, or the fallback when the breaker rejects the call.
    // Args:
    //   key: Breaker key (tools use "tool:<name>").
    //   op: Operation to protect.
    //   fallback: Substitute producing a result while the breaker is open (may be empty).
    // Returns:
    //   op's or fallback's result.
    // Notes:
    //   Exceptions from op are rethrown after being recorded. CallerError exceptions do not count as
    //   breaker failures. Without a usable fallback an open breaker throws CircuitOpenError.
    //==========================================================================================================
    template <typename T>
    T WithBreaker(const std::string& key, const std::function<T()>& op,
                  const std::function<T()>& fallback = {}) {
        auto breaker = Breaker(key);
        std::optional<bool> permit = breaker->TryAcquire();
        if (!permit.has_value()) {
            if (fallback && config_.enableFallbacks) {
                LOG_INFO("Circuit breaker OPEN for {}, using fallback", key);
                return fallback();
            }
            throw CircuitOpenError("Service " + key + " is currently unavailable (circuit breaker OPEN)");
        }
        const bool trial = *permit;
        try {
            T result = op();
            breaker->RecordSuccess(trial);
            return result;
        } catch (const CallerError&) {
            breaker->RecordNeutral(trial);
            throw;
        } catch (...) {
            breaker->RecordFailure(trial);
            throw;
        }
    }

    //==========================================================================================================
    // ExecuteWithRetry
    // Purpose: Retries op with exponential backoff until it succeeds, the error is not retryable, or
    //          maxAttempts is reached. The last error is rethrown.
    //==========================================================================================================
    template <typename T>
    T ExecuteWithRetry(const std::function<T()>& op, const std::string& toolName,
                       const std::string& operation, std::optional<int> maxAttempts = std::nullopt) {
        const int attempts = std::max(1, maxAttempts.value_or(config_.retry.maxAttempts));
        for (int attempt = 1;; ++attempt) {
            try {
                return op();
            } catch (const std::exception& e) {
                if (attempt >= attempts) throw;
                CategorizedError ce = Categorize(e, toolName, operation);
                if (!ce.retryable) throw;
                const int64_t delay = BackoffDelayMs(attempt);
                LOG_WARN("Attempt {}/{} failed for {}.{}, retrying in {}ms: {}",
                         attempt, attempts, toolName, operation, delay, e.what());
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
        }
    }

    // base * multiplier^(attempt-1), capped at maxDelayMs.
    int64_t BackoffDelayMs(int attempt) const;

    bool IsServiceAvailable(const std::string& key);

    // Returns the breaker for key, creating a closed one on first use.
    std::shared_ptr<CircuitBreaker> Breaker(const std::string& key);

    std::vector<CircuitBreakerSnapshot> GetCircuitBreakerStates() const;
    JSONValue CircuitBreakerStatesJSON() const;

    // Returns false when no breaker exists for key.
    bool ResetCircuitBreaker(const std::string& key);

    const ErrorHandlerConfig& Config() const { return config_; }

private:
    void logError(const CategorizedError& e) const;

    ErrorHandlerConfig config_;
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace errors
} // namespace toolhost
