//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, categorized error records and the typed tool outcome union
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Broad origin of a failure; drives degradation strategy and suggestions.
enum class ErrorCategory {
    Validation,
    Integration,
    External,
    Performance,
    System,
    Authentication,
    Authorization,
    RateLimit,
    Resource,
    Unknown
};

enum class ErrorSeverity {
    Critical,
    High,
    Medium,
    Low,
    Info
};

enum class DegradationStrategy {
    Fail,
    Retry,
    Fallback,
    Circuit,
    Cache,
    Partial
};

// Where in the server's error model a failure belongs.
enum class ErrorKind {
    Configuration,
    Validation,
    Execution,
    Timeout,
    CircuitOpen,
    NotFound
};

const char* toString(ErrorCategory c);
const char* toString(ErrorSeverity s);
const char* toString(DegradationStrategy d);
const char* toString(ErrorKind k);

//==========================================================================================================
// MakeErrorCode
// Purpose: Builds the stable code string MCP_<CATEGORY>_<SEVERITY>.
// Notes:
//   The first underscore of the category name is removed, so rate_limit yields MCP_RATELIMIT_MEDIUM.
//==========================================================================================================
std::string MakeErrorCode(ErrorCategory category, ErrorSeverity severity);

//==========================================================================================================
// CategorizedError
// Purpose: Normalized description of a failure as returned to callers and written to the log.
// Fields:
//   category/severity/code: Classification of the failure.
//   message: Original error text.
//   suggestions: Human-readable remediation hints for the category.
//   retryable: Whether resubmitting the same request may succeed.
//   strategy: Degradation strategy selected for the category/severity pair.
//   retryAfterMs: Suggested delay before a retry, when retryable.
//   toolName/operation: Call site that produced the failure.
//   timestamp: When the error was categorized.
//==========================================================================================================
struct CategorizedError {
    ErrorCategory category{ErrorCategory::Unknown};
    ErrorSeverity severity{ErrorSeverity::Medium};
    std::string code;
    std::string message;
    std::vector<std::string> suggestions;
    bool retryable{false};
    DegradationStrategy strategy{DegradationStrategy::Retry};
    std::optional<int64_t> retryAfterMs;
    std::string toolName;
    std::string operation;
    std::chrono::system_clock::time_point timestamp{};

    JSONValue ToJSON() const;
};

//////////////////////////////////////////// Exceptions ////////////////////////////////////////////

// Invalid construction-time settings. Never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(std::vector<std::string> problems);
    explicit ConfigurationError(const std::string& problem);
    const std::vector<std::string>& problems() const { return problems_; }
private:
    std::vector<std::string> problems_;
};

// Duplicate or invalid tool registration.
class RegistrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Errors caused by the caller's input. These never count against a tool's circuit breaker.
class CallerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFoundError : public CallerError {
public:
    using CallerError::CallerError;
};

class ParameterValidationError : public CallerError {
public:
    explicit ParameterValidationError(std::vector<std::string> issues);
    const std::vector<std::string>& issues() const { return issues_; }
private:
    std::vector<std::string> issues_;
};

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CircuitOpenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//////////////////////////////////////////// Tool outcome ////////////////////////////////////////////

struct ToolSuccess {
    JSONValue result;
};

struct ToolFailure {
    ErrorKind kind{ErrorKind::Execution};
    CategorizedError error;
};

using ToolOutcome = std::variant<ToolSuccess, ToolFailure>;

inline bool IsSuccess(const ToolOutcome& o) { return std::holds_alternative<ToolSuccess>(o); }

//==========================================================================================================
// FailureEnvelope
// Purpose: Renders a ToolFailure as { success:false, error{...}, metadata{...} }.
//==========================================================================================================
JSONValue FailureEnvelope(const ToolFailure& failure);

} // namespace errors
} // namespace toolhost
