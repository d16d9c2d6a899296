//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CircuitBreaker.cpp
// Purpose: Circuit breaker state transitions
//==========================================================================================================

#include "toolhost/errors/CircuitBreaker.hpp"
#include "toolhost/JSONHelpers.h"
#include "logging/Logger.h"

#include <algorithm>

namespace toolhost {
namespace errors {

const char* toString(CircuitState s) {
    switch (s) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half-open";
    }
    return "closed";
}

JSONValue CircuitBreakerSnapshot::ToJSON() const {
    json::ObjectBuilder b;
    b.Set("state", toString(state))
     .Set("failures", failures)
     .Set("msUntilRetry", msUntilRetry);
    if (lastFailureTime.has_value()) {
        b.Set("lastFailureTime", json::FormatTimestamp(*lastFailureTime));
    } else {
        b.SetNull("lastFailureTime");
    }
    return b.Build();
}

CircuitBreaker::CircuitBreaker(std::string key, CircuitBreakerConfig config)
    : key_(std::move(key)), config_(config) {}

void CircuitBreaker::openLocked(Clock::time_point now) {
    state_ = CircuitState::Open;
    trialsInFlight_ = 0;
    nextAttempt_ = now + std::chrono::milliseconds(config_.recoveryTimeoutMs);
}

std::optional<bool> CircuitBreaker::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            return false;
        case CircuitState::Open:
            if (Clock::now() < nextAttempt_) {
                return std::nullopt;
            }
            state_ = CircuitState::HalfOpen;
            trialsInFlight_ = 0;
            LOG_INFO("Circuit breaker HALF-OPEN for {} - admitting trial calls", key_);
            [[fallthrough]];
        case CircuitState::HalfOpen:
            if (trialsInFlight_ >= config_.halfOpenMaxCalls) {
                return std::nullopt;
            }
            ++trialsInFlight_;
            return true;
    }
    return std::nullopt;
}

void CircuitBreaker::RecordSuccess(bool /*trial*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HalfOpen) {
        state_ = CircuitState::Closed;
        failures_ = 0;
        trialsInFlight_ = 0;
        LOG_INFO("Circuit breaker CLOSED for {} - service recovered", key_);
    } else if (state_ == CircuitState::Closed) {
        failures_ = std::max(0, failures_ - 1);
    }
}

void CircuitBreaker::RecordFailure(bool /*trial*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    ++failures_;
    lastFailure_ = std::chrono::system_clock::now();
    if (state_ == CircuitState::Closed && failures_ >= config_.failureThreshold) {
        openLocked(now);
        LOG_WARN("Circuit breaker OPEN for {} - too many failures ({})", key_, failures_);
    } else if (state_ == CircuitState::HalfOpen) {
        openLocked(now);
        LOG_WARN("Circuit breaker OPEN for {} - recovery failed", key_);
    }
}

void CircuitBreaker::RecordNeutral(bool trial) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trial && state_ == CircuitState::HalfOpen && trialsInFlight_ > 0) {
        --trialsInFlight_;
    }
}

void CircuitBreaker::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    failures_ = 0;
    trialsInFlight_ = 0;
    lastFailure_.reset();
    LOG_INFO("Circuit breaker for {} reset", key_);
}

CircuitState CircuitBreaker::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int64_t CircuitBreaker::MsUntilRetry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Open) return 0;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(nextAttempt_ - Clock::now()).count();
    return std::max<int64_t>(0, left);
}

CircuitBreakerSnapshot CircuitBreaker::Snapshot() const {
    CircuitBreakerSnapshot s;
    s.key = key_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.state = state_;
        s.failures = failures_;
        s.lastFailureTime = lastFailure_;
    }
    s.msUntilRetry = MsUntilRetry();
    return s;
}

} // namespace errors
} // namespace toolhost
