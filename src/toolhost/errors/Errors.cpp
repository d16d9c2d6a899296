//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: String mapping, exception constructors and JSON rendering for the error taxonomy
//==========================================================================================================

#include "toolhost/errors/Errors.h"
#include "toolhost/JSONHelpers.h"

#include <algorithm>
#include <cctype>

namespace toolhost {
namespace errors {

namespace {

std::string joinProblems(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Validation: return "validation";
        case ErrorCategory::Integration: return "integration";
        case ErrorCategory::External: return "external";
        case ErrorCategory::Performance: return "performance";
        case ErrorCategory::System: return "system";
        case ErrorCategory::Authentication: return "authentication";
        case ErrorCategory::Authorization: return "authorization";
        case ErrorCategory::RateLimit: return "rate_limit";
        case ErrorCategory::Resource: return "resource";
        case ErrorCategory::Unknown: return "unknown";
    }
    return "unknown";
}

const char* toString(ErrorSeverity s) {
    switch (s) {
        case ErrorSeverity::Critical: return "critical";
        case ErrorSeverity::High: return "high";
        case ErrorSeverity::Medium: return "medium";
        case ErrorSeverity::Low: return "low";
        case ErrorSeverity::Info: return "info";
    }
    return "medium";
}

const char* toString(DegradationStrategy d) {
    switch (d) {
        case DegradationStrategy::Fail: return "fail";
        case DegradationStrategy::Retry: return "retry";
        case DegradationStrategy::Fallback: return "fallback";
        case DegradationStrategy::Circuit: return "circuit";
        case DegradationStrategy::Cache: return "cache";
        case DegradationStrategy::Partial: return "partial";
    }
    return "retry";
}

const char* toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Execution: return "execution";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::CircuitOpen: return "circuit_open";
        case ErrorKind::NotFound: return "not_found";
    }
    return "execution";
}

std::string MakeErrorCode(ErrorCategory category, ErrorSeverity severity) {
    std::string cat = toString(category);
    auto us = cat.find('_');
    if (us != std::string::npos) cat.erase(us, 1);
    std::string sev = toString(severity);
    auto upper = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    };
    return "MCP_" + upper(cat) + "_" + upper(sev);
}

JSONValue CategorizedError::ToJSON() const {
    json::ObjectBuilder b;
    b.Set("code", code)
     .Set("message", message)
     .Set("category", toString(category))
     .Set("severity", toString(severity))
     .Set("suggestions", suggestions)
     .Set("timestamp", json::FormatTimestamp(timestamp));
    if (!toolName.empty()) b.Set("toolName", toolName);
    if (!operation.empty()) b.Set("operation", operation);
    return b.Build();
}

ConfigurationError::ConfigurationError(std::vector<std::string> problems)
    : std::runtime_error("Invalid server configuration: " + joinProblems(problems, "; ")),
      problems_(std::move(problems)) {}

ConfigurationError::ConfigurationError(const std::string& problem)
    : std::runtime_error("Invalid server configuration: " + problem),
      problems_{problem} {}

ParameterValidationError::ParameterValidationError(std::vector<std::string> issues)
    : CallerError("Parameter validation failed: " + joinProblems(issues, ", ")),
      issues_(std::move(issues)) {}

JSONValue FailureEnvelope(const ToolFailure& failure) {
    const CategorizedError& e = failure.error;
    JSONValue errorObj = e.ToJSON();
    std::get<JSONValue::Object>(errorObj.value)["kind"] =
        std::make_shared<JSONValue>(toString(failure.kind));

    json::ObjectBuilder meta;
    meta.Set("degradationStrategy", toString(e.strategy))
        .Set("retryable", e.retryable);
    if (e.retryAfterMs.has_value() && *e.retryAfterMs > 0) {
        meta.Set("retryAfterMs", *e.retryAfterMs);
    }

    return json::ObjectBuilder()
        .Set("success", false)
        .Set("error", std::move(errorObj))
        .Set("metadata", meta.Build())
        .Build();
}

} // namespace errors
} // namespace toolhost
