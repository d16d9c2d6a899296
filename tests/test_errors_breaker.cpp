//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors_breaker.cpp
// Purpose: GoogleTests for error categorization, failure envelopes, circuit breakers and retry
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

#include "toolhost/JSONHelpers.h"
#include "toolhost/errors/ErrorHandler.hpp"

using namespace toolhost;
using namespace toolhost::errors;
using namespace std::chrono_literals;

namespace {

ErrorHandlerConfig quietConfig() {
    ErrorHandlerConfig cfg;
    cfg.logErrors = false;
    cfg.retry.baseDelayMs = 1;
    cfg.retry.maxDelayMs = 5;
    return cfg;
}

} // namespace

TEST(ErrorCategorization, MessageRules) {
    ErrorHandler h(quietConfig());
    EXPECT_EQ(h.Categorize("invalid argument", "t", "op").category, ErrorCategory::Validation);
    EXPECT_EQ(h.Categorize("request timeout", "t", "op").category, ErrorCategory::Performance);
    EXPECT_EQ(h.Categorize("connect ECONNREFUSED", "t", "op").category, ErrorCategory::External);
    EXPECT_EQ(h.Categorize("permission denied", "t", "op").category, ErrorCategory::Authorization);
    EXPECT_EQ(h.Categorize("rate limit exceeded", "t", "op").category, ErrorCategory::RateLimit);
    EXPECT_EQ(h.Categorize("file not found", "t", "op").category, ErrorCategory::Resource);
    EXPECT_EQ(h.Categorize("EMFILE: too many open files", "t", "op").category, ErrorCategory::System);
    EXPECT_EQ(h.Categorize("something odd", "t", "op").category, ErrorCategory::Unknown);
}

TEST(ErrorCategorization, StrategyAndRetryability) {
    ErrorHandler h(quietConfig());

    CategorizedError validation = h.Categorize("validation failed", "t", "op");
    EXPECT_EQ(validation.strategy, DegradationStrategy::Fail);
    EXPECT_FALSE(validation.retryable);

    CategorizedError timeout = h.Categorize("timeout", "t", "op");
    EXPECT_EQ(timeout.severity, ErrorSeverity::High);
    EXPECT_EQ(timeout.strategy, DegradationStrategy::Retry);
    EXPECT_TRUE(timeout.retryable);

    CategorizedError external = h.Categorize("ENOTFOUND host", "t", "op");
    EXPECT_EQ(external.strategy, DegradationStrategy::Circuit);

    CategorizedError system = h.Categorize("ENOMEM", "t", "op");
    EXPECT_EQ(system.severity, ErrorSeverity::Critical);
    EXPECT_FALSE(system.retryable);
    EXPECT_EQ(system.code, "MCP_SYSTEM_CRITICAL");
}

TEST(ErrorCategorization, TypedExceptionsWinOverMessage) {
    ErrorHandler h(quietConfig());
    EXPECT_EQ(h.Categorize(TimeoutError("took too long"), "t", "op").category, ErrorCategory::Performance);
    EXPECT_EQ(h.Categorize(CircuitOpenError("breaker"), "t", "op").category, ErrorCategory::External);
    EXPECT_EQ(h.Categorize(NotFoundError("missing"), "t", "op").category, ErrorCategory::Resource);
    EXPECT_EQ(h.Categorize(ParameterValidationError({"x is required"}), "t", "op").category,
              ErrorCategory::Validation);
}

TEST(ErrorCategorization, HandleErrorSetsRetryAfterForRetryable) {
    ErrorHandler h(quietConfig());
    CategorizedError e = h.HandleError(std::runtime_error("timeout talking to backend"), "fetch", "execute");
    ASSERT_TRUE(e.retryAfterMs.has_value());
    EXPECT_EQ(*e.retryAfterMs, 1);
    EXPECT_EQ(e.toolName, "fetch");
    EXPECT_EQ(e.operation, "execute");

    CategorizedError v = h.HandleError(std::runtime_error("invalid input"), "fetch", "execute");
    EXPECT_FALSE(v.retryAfterMs.has_value());
}

TEST(ErrorCategorization, HandleErrorFromExceptionPtr) {
    ErrorHandler h(quietConfig());
    std::exception_ptr p = std::make_exception_ptr(TimeoutError("late"));
    EXPECT_EQ(h.HandleError(p, "t", "op").category, ErrorCategory::Performance);
}

TEST(FailureEnvelopeTest, Shape) {
    ErrorHandler h(quietConfig());
    ToolFailure f{ErrorKind::Timeout, h.HandleError(TimeoutError("Tool 'slow' timed out after 1000ms"), "slow", "execute")};
    JSONValue env = FailureEnvelope(f);

    EXPECT_FALSE(json::GetBool(env, "success").value_or(true));
    const JSONValue* err = json::Find(env, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(json::GetString(*err, "kind").value_or(""), "timeout");
    EXPECT_EQ(json::GetString(*err, "category").value_or(""), "performance");
    EXPECT_EQ(json::GetString(*err, "toolName").value_or(""), "slow");
    const JSONValue* meta = json::Find(env, "metadata");
    ASSERT_NE(meta, nullptr);
    EXPECT_TRUE(json::GetBool(*meta, "retryable").value_or(false));
    EXPECT_EQ(json::GetString(*meta, "degradationStrategy").value_or(""), "retry");
}

TEST(CircuitBreakerTest, OpensAtThresholdAndRejects) {
    CircuitBreaker b("tool:x", CircuitBreakerConfig{3, 60000, 1});
    for (int i = 0; i < 3; ++i) {
        auto permit = b.TryAcquire();
        ASSERT_TRUE(permit.has_value());
        b.RecordFailure(*permit);
    }
    EXPECT_EQ(b.State(), CircuitState::Open);
    EXPECT_FALSE(b.TryAcquire().has_value());
    EXPECT_GT(b.MsUntilRetry(), 0);
}

TEST(CircuitBreakerTest, SuccessDecrementsFailuresWhileClosed) {
    CircuitBreaker b("k", CircuitBreakerConfig{3, 60000, 1});
    b.RecordFailure(false);
    b.RecordFailure(false);
    b.RecordSuccess(false);
    EXPECT_EQ(b.Snapshot().failures, 1);
    b.RecordFailure(false);
    EXPECT_EQ(b.State(), CircuitState::Closed);
}

TEST(CircuitBreakerTest, HalfOpenTrialClosesOnSuccess) {
    CircuitBreaker b("k", CircuitBreakerConfig{1, 20, 1});
    b.RecordFailure(false);
    ASSERT_EQ(b.State(), CircuitState::Open);
    std::this_thread::sleep_for(40ms);

    auto trial = b.TryAcquire();
    ASSERT_TRUE(trial.has_value());
    EXPECT_TRUE(*trial);
    EXPECT_EQ(b.State(), CircuitState::HalfOpen);
    // Only one trial slot.
    EXPECT_FALSE(b.TryAcquire().has_value());

    b.RecordSuccess(true);
    EXPECT_EQ(b.State(), CircuitState::Closed);
    EXPECT_EQ(b.Snapshot().failures, 0);
}

TEST(CircuitBreakerTest, HalfOpenTrialFailureReopens) {
    CircuitBreaker b("k", CircuitBreakerConfig{1, 20, 2});
    b.RecordFailure(false);
    std::this_thread::sleep_for(40ms);
    auto trial = b.TryAcquire();
    ASSERT_TRUE(trial.has_value());
    b.RecordFailure(*trial);
    EXPECT_EQ(b.State(), CircuitState::Open);
}

TEST(CircuitBreakerTest, NeutralReleasesTrialSlot) {
    CircuitBreaker b("k", CircuitBreakerConfig{1, 20, 1});
    b.RecordFailure(false);
    std::this_thread::sleep_for(40ms);
    auto trial = b.TryAcquire();
    ASSERT_TRUE(trial.has_value());
    b.RecordNeutral(*trial);
    EXPECT_EQ(b.State(), CircuitState::HalfOpen);
    EXPECT_TRUE(b.TryAcquire().has_value());
}

TEST(ErrorHandlerBreaker, CallerErrorsDoNotTrip) {
    ErrorHandlerConfig cfg = quietConfig();
    cfg.circuitBreaker.failureThreshold = 2;
    ErrorHandler h(cfg);

    std::function<int()> bad = []() -> int { throw ParameterValidationError({"x is required"}); };
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(h.WithBreaker<int>("tool:v", bad), ParameterValidationError);
    }
    EXPECT_EQ(h.Breaker("tool:v")->State(), CircuitState::Closed);
}

TEST(ErrorHandlerBreaker, OpenBreakerUsesFallbackOrThrows) {
    ErrorHandlerConfig cfg = quietConfig();
    cfg.circuitBreaker.failureThreshold = 2;
    ErrorHandler h(cfg);

    std::function<int()> failing = []() -> int { throw std::runtime_error("backend down"); };
    EXPECT_THROW(h.WithBreaker<int>("tool:f", failing), std::runtime_error);
    EXPECT_THROW(h.WithBreaker<int>("tool:f", failing), std::runtime_error);
    EXPECT_FALSE(h.IsServiceAvailable("tool:f"));

    std::function<int()> ok = [] { return 1; };
    std::function<int()> fallback = [] { return 42; };
    EXPECT_EQ(h.WithBreaker<int>("tool:f", ok, fallback), 42);
    EXPECT_THROW(h.WithBreaker<int>("tool:f", ok), CircuitOpenError);

    CategorizedError e = h.HandleError(CircuitOpenError("open"), "f", "execute", "tool:f");
    ASSERT_TRUE(e.retryAfterMs.has_value());
    EXPECT_GT(*e.retryAfterMs, 1);

    EXPECT_TRUE(h.ResetCircuitBreaker("tool:f"));
    EXPECT_FALSE(h.ResetCircuitBreaker("tool:unknown"));
    EXPECT_EQ(h.WithBreaker<int>("tool:f", ok), 1);
}

TEST(ErrorHandlerBreaker, StatesJSONListsBreakers) {
    ErrorHandler h(quietConfig());
    h.Breaker("tool:a");
    JSONValue states = h.CircuitBreakerStatesJSON();
    const JSONValue* a = json::Find(states, "tool:a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(json::GetString(*a, "state").value_or(""), "closed");
}

TEST(ErrorHandlerRetry, RetriesRetryableThenSucceeds) {
    ErrorHandler h(quietConfig());
    int calls = 0;
    std::function<int()> op = [&calls]() -> int {
        if (++calls < 3) throw std::runtime_error("timeout");
        return 7;
    };
    EXPECT_EQ(h.ExecuteWithRetry<int>(op, "t", "op"), 7);
    EXPECT_EQ(calls, 3);
}

TEST(ErrorHandlerRetry, StopsOnNonRetryable) {
    ErrorHandler h(quietConfig());
    int calls = 0;
    std::function<int()> op = [&calls]() -> int {
        ++calls;
        throw std::runtime_error("invalid request");
    };
    EXPECT_THROW(h.ExecuteWithRetry<int>(op, "t", "op"), std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST(ErrorHandlerRetry, BackoffIsCapped) {
    ErrorHandlerConfig cfg;
    cfg.logErrors = false;
    ErrorHandler h(cfg);
    EXPECT_EQ(h.BackoffDelayMs(1), 1000);
    EXPECT_EQ(h.BackoffDelayMs(2), 2000);
    EXPECT_EQ(h.BackoffDelayMs(10), 30000);
}
