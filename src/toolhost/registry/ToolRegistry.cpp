//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: ToolRegistry implementation
//==========================================================================================================

#include "toolhost/registry/ToolRegistry.hpp"
#include "toolhost/errors/Errors.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>
#include <set>
#include <unordered_map>

namespace toolhost {
namespace registry {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool isValidToolName(const std::string& name) {
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-';
    });
}

bool isSemver(const std::string& v) {
    static const std::regex re(R"(^\d+\.\d+\.\d+(-[\w.-]+)?(\+[\w.-]+)?$)");
    return std::regex_match(v, re);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

bool matches(const RegisteredTool& tool, const ToolFilter& filter) {
    const ToolMetadata& m = tool.metadata;
    if (filter.category && m.category != *filter.category) return false;
    if (filter.name && toLower(m.name).find(toLower(*filter.name)) == std::string::npos) return false;
    if (filter.isActive && tool.isActive != *filter.isActive) return false;
    if (filter.hasExamples && (!m.examples.empty()) != *filter.hasExamples) return false;
    if (filter.complexity) {
        if (!m.performance || !m.performance->complexity || *m.performance->complexity != *filter.complexity) {
            return false;
        }
    }
    if (filter.tags) {
        for (const auto& tag : *filter.tags) {
            if (std::find(m.tags.begin(), m.tags.end(), tag) == m.tags.end()) return false;
        }
    }
    return true;
}

} // namespace

class ToolRegistry::Impl {
public:
    mutable std::mutex mutex;
    // Registration order; index holds positions into entries.
    std::vector<RegisteredTool> entries;
    std::unordered_map<std::string, std::size_t> index;
    std::set<std::string> categories;
    std::set<std::string> tags;

    RegisteredTool* findLocked(const std::string& name) {
        auto it = index.find(name);
        return it == index.end() ? nullptr : &entries[it->second];
    }

    void accumulateLocked(const ToolMetadata& m) {
        categories.insert(m.category);
        tags.insert(m.tags.begin(), m.tags.end());
    }

    void reindexLocked() {
        index.clear();
        for (std::size_t i = 0; i < entries.size(); ++i) index[entries[i].metadata.name] = i;
    }
};

ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) {}
ToolRegistry::~ToolRegistry() = default;

ValidationResult ToolRegistry::ValidateTool(const ToolMetadata& metadata,
                                            const std::shared_ptr<const IParameterContract>& /*parameters*/) const {
    ValidationResult r;
    if (isBlank(metadata.name)) r.errors.emplace_back("Tool name is required");
    if (isBlank(metadata.description)) r.errors.emplace_back("Tool description is required");
    if (isBlank(metadata.category)) r.errors.emplace_back("Tool category is required");
    if (isBlank(metadata.version)) r.errors.emplace_back("Tool version is required");

    if (!metadata.name.empty() && !isValidToolName(metadata.name)) {
        r.errors.emplace_back("Tool name must contain only alphanumeric characters, underscores, and hyphens");
    }
    if (!metadata.version.empty() && !isSemver(metadata.version)) {
        r.warnings.emplace_back("Tool version should follow semantic versioning (e.g., 1.0.0)");
    }
    if (metadata.examples.empty()) {
        r.warnings.emplace_back("Tool should include usage examples");
    }
    if (!metadata.documentation.has_value()) {
        r.warnings.emplace_back("Tool should include documentation");
    }
    r.isValid = r.errors.empty();
    r.validatedAt = std::chrono::system_clock::now();
    return r;
}

void ToolRegistry::RegisterTool(const ToolMetadata& metadata,
                                std::shared_ptr<const IParameterContract> parameters,
                                ToolInvoker invoker,
                                const RegistrationOptions& options) {
    if (!parameters) {
        parameters = ParameterSchema::Empty();
    }

    std::optional<ValidationResult> validation;
    if (options.validateOnRegistration) {
        validation = ValidateTool(metadata, parameters);
        if (!validation->isValid) {
            throw errors::RegistrationError("Tool validation failed: " + join(validation->errors, ", "));
        }
    }

    RegisteredTool entry;
    entry.metadata = metadata;
    entry.parameters = std::move(parameters);
    entry.invoker = std::move(invoker);
    entry.registeredAt = std::chrono::system_clock::now();
    entry.usageCount = 0;
    entry.isActive = options.autoActivate;
    entry.validationResults = std::move(validation);

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        RegisteredTool* existing = pImpl->findLocked(metadata.name);
        if (existing != nullptr && !options.replaceExisting) {
            throw errors::RegistrationError("Tool '" + metadata.name +
                                            "' is already registered. Use replaceExisting: true to overwrite.");
        }
        if (existing != nullptr) {
            *existing = std::move(entry);
        } else {
            pImpl->index[metadata.name] = pImpl->entries.size();
            pImpl->entries.push_back(std::move(entry));
        }
        pImpl->accumulateLocked(metadata);
    }

    LOG_INFO("Tool registered in registry: {} (category={}, tags=[{}], active={})",
             metadata.name, metadata.category, join(metadata.tags, ","), options.autoActivate);
}

std::vector<RegisteredTool> ToolRegistry::DiscoverTools(const ToolFilter& filter) const {
    std::vector<RegisteredTool> out;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& t : pImpl->entries) {
            if (matches(t, filter)) out.push_back(t);
        }
    }
    std::sort(out.begin(), out.end(), [](const RegisteredTool& a, const RegisteredTool& b) {
        return a.metadata.name < b.metadata.name;
    });
    return out;
}

std::optional<RegisteredTool> ToolRegistry::GetTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    RegisteredTool* t = pImpl->findLocked(name);
    if (t == nullptr) return std::nullopt;
    return *t;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->index.count(name) != 0;
}

std::vector<RegisteredTool> ToolRegistry::GetAllTools() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->entries;
}

std::vector<std::string> ToolRegistry::GetCategories() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return std::vector<std::string>(pImpl->categories.begin(), pImpl->categories.end());
}

std::vector<std::string> ToolRegistry::GetTags() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return std::vector<std::string>(pImpl->tags.begin(), pImpl->tags.end());
}

void ToolRegistry::UpdateToolMetadata(const std::string& name, const ToolMetadataPatch& patch) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        RegisteredTool* t = pImpl->findLocked(name);
        if (t == nullptr) {
            throw errors::NotFoundError("Tool '" + name + "' not found");
        }
        patch.ApplyTo(t->metadata);
        pImpl->accumulateLocked(t->metadata);
    }
    LOG_INFO("Tool metadata updated: {} (fields: {})", name, join(patch.FieldNames(), ","));
}

void ToolRegistry::SetToolActive(const std::string& name, bool isActive) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        RegisteredTool* t = pImpl->findLocked(name);
        if (t == nullptr) {
            throw errors::NotFoundError("Tool '" + name + "' not found");
        }
        t->isActive = isActive;
    }
    LOG_INFO("Tool status changed: {} isActive={}", name, isActive);
}

void ToolRegistry::UnregisterTool(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->index.find(name);
        if (it == pImpl->index.end()) {
            throw errors::NotFoundError("Tool '" + name + "' not found");
        }
        pImpl->entries.erase(pImpl->entries.begin() + static_cast<std::ptrdiff_t>(it->second));
        pImpl->reindexLocked();
    }
    LOG_INFO("Tool unregistered: {}", name);
}

void ToolRegistry::RecordToolUsage(const std::string& name) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    RegisteredTool* t = pImpl->findLocked(name);
    if (t == nullptr) return;
    ++t->usageCount;
    t->lastUsed = std::chrono::system_clock::now();
}

UsageStatistics ToolRegistry::GetUsageStatistics() const {
    UsageStatistics s;
    std::vector<ToolUsage> used;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        s.totalTools = pImpl->entries.size();
        for (const auto& t : pImpl->entries) {
            if (t.isActive) ++s.activeTools;
            s.totalUsage += t.usageCount;
            if (t.usageCount > 0) used.push_back({t.metadata.name, t.usageCount});
            ++s.categoryCounts[t.metadata.category];
            for (const auto& tag : t.metadata.tags) ++s.tagCounts[tag];
        }
    }
    std::stable_sort(used.begin(), used.end(),
                     [](const ToolUsage& a, const ToolUsage& b) { return a.usage > b.usage; });
    if (!used.empty()) {
        s.mostUsedTool = used.front();
        s.leastUsedTool = used.back();
    }
    return s;
}

RegistryHealth ToolRegistry::GetHealthStatus() const {
    RegistryHealth h;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    h.totalTools = pImpl->entries.size();
    for (const auto& t : pImpl->entries) {
        if (t.isActive) ++h.activeTools;
        else ++h.inactiveTools;
        if (t.validationResults && !t.validationResults->isValid) {
            ++h.toolsWithIssues;
            h.issues.push_back("Tool '" + t.metadata.name + "' has validation errors: " +
                               join(t.validationResults->errors, ", "));
        }
    }
    if (h.toolsWithIssues > 0) {
        h.status = HealthLevel::Error;
    } else if (h.inactiveTools > h.activeTools) {
        h.status = HealthLevel::Warning;
        h.issues.emplace_back("More inactive tools than active tools");
    }
    return h;
}

void ToolRegistry::Clear() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->entries.clear();
        pImpl->index.clear();
        pImpl->categories.clear();
        pImpl->tags.clear();
    }
    LOG_INFO("Tool registry cleared");
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->entries.size();
}

} // namespace registry
} // namespace toolhost
