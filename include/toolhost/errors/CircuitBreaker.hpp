//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CircuitBreaker.hpp
// Purpose: Thread-safe closed/open/half-open circuit breaker keyed by service or tool name
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

const char* toString(CircuitState s);

//==========================================================================================================
// CircuitBreakerConfig
// Fields:
//   failureThreshold: Failures while closed that open the breaker.
//   recoveryTimeoutMs: Time an open breaker rejects calls before admitting trial calls.
//   halfOpenMaxCalls: Maximum concurrent trial calls while half-open.
//==========================================================================================================
struct CircuitBreakerConfig {
    int failureThreshold{5};
    int64_t recoveryTimeoutMs{60000};
    int halfOpenMaxCalls{3};
};

struct CircuitBreakerSnapshot {
    std::string key;
    CircuitState state{CircuitState::Closed};
    int failures{0};
    std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    int64_t msUntilRetry{0};

    JSONValue ToJSON() const;
};

class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    CircuitBreaker(std::string key, CircuitBreakerConfig config);

    //==========================================================================================================
    // TryAcquire
    // Purpose: Asks permission to run one call.
    // Returns:
    //   std::nullopt when the call must be rejected; otherwise a flag telling whether the call is a
    //   half-open trial, which must be passed back to exactly one of the Record* methods.
    // Notes:
    //   An open breaker whose recovery timeout elapsed moves to half-open here.
    //==========================================================================================================
    std::optional<bool> TryAcquire();

    void RecordSuccess(bool trial);
    void RecordFailure(bool trial);

    // Releases a trial slot without judging the call (used for caller errors).
    void RecordNeutral(bool trial);

    void Reset();

    CircuitState State() const;
    CircuitBreakerSnapshot Snapshot() const;
    int64_t MsUntilRetry() const;
    const std::string& Key() const { return key_; }

private:
    void openLocked(Clock::time_point now);

    const std::string key_;
    const CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    int failures_{0};
    int trialsInFlight_{0};
    Clock::time_point nextAttempt_{};
    std::optional<std::chrono::system_clock::time_point> lastFailure_;
};

} // namespace errors
} // namespace toolhost
