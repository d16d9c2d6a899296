//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolTypes.h
// Purpose: Tool metadata, registration options, discovery filters and registry reports
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/ParameterContract.h"

namespace toolhost {
namespace registry {

using TimePoint = std::chrono::system_clock::time_point;

enum class Complexity { Low, Medium, High };
enum class ResourceUsage { Light, Moderate, Heavy };

const char* toString(Complexity c);
const char* toString(ResourceUsage r);
std::optional<Complexity> complexityFromString(const std::string& s);
std::optional<ResourceUsage> resourceUsageFromString(const std::string& s);

struct ToolExample {
    std::string title;
    std::string description;
    JSONValue input;
    std::optional<JSONValue> expectedOutput;
};

struct PerformanceHints {
    std::optional<int64_t> expectedResponseTime;
    std::optional<Complexity> complexity;
    std::optional<ResourceUsage> resourceUsage;
};

//==========================================================================================================
// ToolMetadata
// Purpose: Descriptive data of a tool. name is the registry key (letters, digits, '_' and '-').
//==========================================================================================================
struct ToolMetadata {
    std::string name;
    std::string description;
    std::string version;
    std::string category;
    std::vector<std::string> tags;
    std::optional<std::string> author;
    std::optional<std::string> documentation;
    std::vector<ToolExample> examples;
    std::optional<std::vector<std::string>> dependencies;
    std::optional<PerformanceHints> performance;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolMetadataPatch
// Purpose: Partial metadata update; absent fields are preserved. The name cannot be patched.
//==========================================================================================================
struct ToolMetadataPatch {
    std::optional<std::string> description;
    std::optional<std::string> version;
    std::optional<std::string> category;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> author;
    std::optional<std::string> documentation;
    std::optional<std::vector<ToolExample>> examples;
    std::optional<std::vector<std::string>> dependencies;
    std::optional<PerformanceHints> performance;

    // Reads the known fields of a JSON object; "name" and unknown keys are ignored.
    // Throws std::invalid_argument when a known field has the wrong JSON type.
    static ToolMetadataPatch FromJSON(const JSONValue& obj);

    void ApplyTo(ToolMetadata& metadata) const;
    std::vector<std::string> FieldNames() const;
};

struct ValidationResult {
    bool isValid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    TimePoint validatedAt{};

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolFilter
// Purpose: Conjunctive discovery filter; every unset field matches all tools.
// Fields:
//   category: Exact category.
//   name: Case-insensitive substring of the tool name.
//   isActive: Exact activation flag.
//   hasExamples: Whether the examples list is non-empty.
//   complexity: Exact performance complexity.
//   tags: Every listed tag must be present on the tool.
//==========================================================================================================
struct ToolFilter {
    std::optional<std::string> category;
    std::optional<std::string> name;
    std::optional<bool> isActive;
    std::optional<bool> hasExamples;
    std::optional<Complexity> complexity;
    std::optional<std::vector<std::string>> tags;

    static ToolFilter FromJSON(const JSONValue& obj);

    // Stable textual form used as a cache key.
    std::string CacheKey() const;
};

struct RegistrationOptions {
    bool replaceExisting{false};
    bool validateOnRegistration{true};
    bool autoActivate{true};
};

// Invocable form of a tool as stored by the registry (already wrapped, never throws).
using ToolInvoker = std::function<errors::ToolOutcome(const JSONValue& params)>;

//==========================================================================================================
// RegisteredTool
// Purpose: Snapshot of a registry entry.
//==========================================================================================================
struct RegisteredTool {
    ToolMetadata metadata;
    std::shared_ptr<const IParameterContract> parameters;
    ToolInvoker invoker;
    TimePoint registeredAt{};
    std::optional<TimePoint> lastUsed;
    uint64_t usageCount{0};
    bool isActive{true};
    std::optional<ValidationResult> validationResults;

    // Metadata and bookkeeping without the invoker.
    JSONValue ToJSON() const;
};

struct ToolUsage {
    std::string name;
    uint64_t usage{0};
};

struct UsageStatistics {
    std::size_t totalTools{0};
    std::size_t activeTools{0};
    uint64_t totalUsage{0};
    std::optional<ToolUsage> mostUsedTool;
    std::optional<ToolUsage> leastUsedTool;
    std::map<std::string, std::size_t> categoryCounts;
    std::map<std::string, std::size_t> tagCounts;

    JSONValue ToJSON() const;
};

enum class HealthLevel { Healthy, Warning, Error };

const char* toString(HealthLevel h);

struct RegistryHealth {
    HealthLevel status{HealthLevel::Healthy};
    std::size_t totalTools{0};
    std::size_t activeTools{0};
    std::size_t inactiveTools{0};
    std::size_t toolsWithIssues{0};
    std::vector<std::string> issues;

    JSONValue ToJSON() const;
};

} // namespace registry
} // namespace toolhost
