//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolTypes.cpp
// Purpose: JSON conversion for registry types
//==========================================================================================================

#include "toolhost/registry/ToolTypes.h"
#include "toolhost/JSONHelpers.h"

#include <stdexcept>

namespace toolhost {
namespace registry {

namespace {

std::string requireString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = json::Find(obj, key);
    if (!std::holds_alternative<std::string>(v->value)) {
        throw std::invalid_argument("Metadata field '" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

std::vector<std::string> requireStringList(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = json::Find(obj, key);
    if (!v->IsArray()) {
        throw std::invalid_argument("Metadata field '" + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (!item || !item->IsString()) {
            throw std::invalid_argument("Metadata field '" + key + "' must be an array of strings");
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

JSONValue exampleToJSON(const ToolExample& ex) {
    json::ObjectBuilder b;
    b.Set("title", ex.title).Set("description", ex.description).Set("input", ex.input);
    if (ex.expectedOutput.has_value()) b.Set("expectedOutput", *ex.expectedOutput);
    return b.Build();
}

ToolExample exampleFromJSON(const JSONValue& v) {
    if (!v.IsObject()) {
        throw std::invalid_argument("Tool examples must be objects");
    }
    ToolExample ex;
    ex.title = json::GetString(v, "title").value_or("");
    ex.description = json::GetString(v, "description").value_or("");
    if (const JSONValue* in = json::Find(v, "input")) ex.input = *in;
    else ex.input = json::EmptyObject();
    if (const JSONValue* out = json::Find(v, "expectedOutput")) ex.expectedOutput = *out;
    return ex;
}

JSONValue performanceToJSON(const PerformanceHints& p) {
    json::ObjectBuilder b;
    if (p.expectedResponseTime.has_value()) b.Set("expectedResponseTime", *p.expectedResponseTime);
    if (p.complexity.has_value()) b.Set("complexity", toString(*p.complexity));
    if (p.resourceUsage.has_value()) b.Set("resourceUsage", toString(*p.resourceUsage));
    return b.Build();
}

PerformanceHints performanceFromJSON(const JSONValue& v) {
    if (!v.IsObject()) {
        throw std::invalid_argument("Metadata field 'performance' must be an object");
    }
    PerformanceHints p;
    p.expectedResponseTime = json::GetInt(v, "expectedResponseTime");
    if (auto c = json::GetString(v, "complexity")) {
        p.complexity = complexityFromString(*c);
        if (!p.complexity) throw std::invalid_argument("Unknown complexity '" + *c + "'");
    }
    if (auto r = json::GetString(v, "resourceUsage")) {
        p.resourceUsage = resourceUsageFromString(*r);
        if (!p.resourceUsage) throw std::invalid_argument("Unknown resourceUsage '" + *r + "'");
    }
    return p;
}

} // namespace

const char* toString(Complexity c) {
    switch (c) {
        case Complexity::Low: return "low";
        case Complexity::Medium: return "medium";
        case Complexity::High: return "high";
    }
    return "medium";
}

const char* toString(ResourceUsage r) {
    switch (r) {
        case ResourceUsage::Light: return "light";
        case ResourceUsage::Moderate: return "moderate";
        case ResourceUsage::Heavy: return "heavy";
    }
    return "moderate";
}

std::optional<Complexity> complexityFromString(const std::string& s) {
    if (s == "low") return Complexity::Low;
    if (s == "medium") return Complexity::Medium;
    if (s == "high") return Complexity::High;
    return std::nullopt;
}

std::optional<ResourceUsage> resourceUsageFromString(const std::string& s) {
    if (s == "light") return ResourceUsage::Light;
    if (s == "moderate") return ResourceUsage::Moderate;
    if (s == "heavy") return ResourceUsage::Heavy;
    return std::nullopt;
}

const char* toString(HealthLevel h) {
    switch (h) {
        case HealthLevel::Healthy: return "healthy";
        case HealthLevel::Warning: return "warning";
        case HealthLevel::Error: return "error";
    }
    return "error";
}

JSONValue ToolMetadata::ToJSON() const {
    json::ObjectBuilder b;
    b.Set("name", name)
     .Set("description", description)
     .Set("version", version)
     .Set("category", category)
     .Set("tags", tags);
    if (author.has_value()) b.Set("author", *author);
    if (documentation.has_value()) b.Set("documentation", *documentation);
    JSONValue::Array ex;
    for (const auto& e : examples) ex.push_back(std::make_shared<JSONValue>(exampleToJSON(e)));
    b.Set("examples", JSONValue(std::move(ex)));
    if (dependencies.has_value()) b.Set("dependencies", *dependencies);
    if (performance.has_value()) b.Set("performance", performanceToJSON(*performance));
    return b.Build();
}

ToolMetadataPatch ToolMetadataPatch::FromJSON(const JSONValue& obj) {
    if (!obj.IsObject()) {
        throw std::invalid_argument("Metadata patch must be an object");
    }
    ToolMetadataPatch p;
    if (json::Has(obj, "description")) p.description = requireString(obj, "description");
    if (json::Has(obj, "version")) p.version = requireString(obj, "version");
    if (json::Has(obj, "category")) p.category = requireString(obj, "category");
    if (json::Has(obj, "tags")) p.tags = requireStringList(obj, "tags");
    if (json::Has(obj, "author")) p.author = requireString(obj, "author");
    if (json::Has(obj, "documentation")) p.documentation = requireString(obj, "documentation");
    if (json::Has(obj, "dependencies")) p.dependencies = requireStringList(obj, "dependencies");
    if (const JSONValue::Array* arr = json::GetArray(obj, "examples")) {
        std::vector<ToolExample> examples;
        for (const auto& item : *arr) {
            if (item) examples.push_back(exampleFromJSON(*item));
        }
        p.examples = std::move(examples);
    } else if (json::Has(obj, "examples")) {
        throw std::invalid_argument("Metadata field 'examples' must be an array");
    }
    if (const JSONValue* perf = json::Find(obj, "performance")) {
        p.performance = performanceFromJSON(*perf);
    }
    return p;
}

void ToolMetadataPatch::ApplyTo(ToolMetadata& m) const {
    if (description) m.description = *description;
    if (version) m.version = *version;
    if (category) m.category = *category;
    if (tags) m.tags = *tags;
    if (author) m.author = *author;
    if (documentation) m.documentation = *documentation;
    if (examples) m.examples = *examples;
    if (dependencies) m.dependencies = *dependencies;
    if (performance) m.performance = *performance;
}

std::vector<std::string> ToolMetadataPatch::FieldNames() const {
    std::vector<std::string> out;
    if (description) out.emplace_back("description");
    if (version) out.emplace_back("version");
    if (category) out.emplace_back("category");
    if (tags) out.emplace_back("tags");
    if (author) out.emplace_back("author");
    if (documentation) out.emplace_back("documentation");
    if (examples) out.emplace_back("examples");
    if (dependencies) out.emplace_back("dependencies");
    if (performance) out.emplace_back("performance");
    return out;
}

JSONValue ValidationResult::ToJSON() const {
    return json::ObjectBuilder()
        .Set("isValid", isValid)
        .Set("errors", errors)
        .Set("warnings", warnings)
        .Set("validatedAt", json::FormatTimestamp(validatedAt))
        .Build();
}

ToolFilter ToolFilter::FromJSON(const JSONValue& obj) {
    ToolFilter f;
    if (!obj.IsObject()) return f;
    f.category = json::GetString(obj, "category");
    f.name = json::GetString(obj, "name");
    f.isActive = json::GetBool(obj, "isActive");
    f.hasExamples = json::GetBool(obj, "hasExamples");
    if (auto c = json::GetString(obj, "complexity")) {
        f.complexity = complexityFromString(*c);
        if (!f.complexity) throw std::invalid_argument("Unknown complexity '" + *c + "'");
    }
    f.tags = json::GetStringList(obj, "tags");
    return f;
}

std::string ToolFilter::CacheKey() const {
    // [[field, value], ...] in declaration order; only present fields appear, values keep JSON escaping.
    JSONValue::Array fields;
    auto add = [&fields](const char* field, JSONValue value) {
        JSONValue::Array pair;
        pair.push_back(std::make_shared<JSONValue>(field));
        pair.push_back(std::make_shared<JSONValue>(std::move(value)));
        fields.push_back(std::make_shared<JSONValue>(std::move(pair)));
    };
    if (category) add("category", JSONValue(*category));
    if (name) add("name", JSONValue(*name));
    if (isActive) add("isActive", JSONValue(*isActive));
    if (hasExamples) add("hasExamples", JSONValue(*hasExamples));
    if (complexity) add("complexity", JSONValue(toString(*complexity)));
    if (tags) {
        JSONValue::Array list;
        for (const auto& t : *tags) list.push_back(std::make_shared<JSONValue>(t));
        add("tags", JSONValue(std::move(list)));
    }
    return SerializeJSON(JSONValue(std::move(fields)));
}

JSONValue RegisteredTool::ToJSON() const {
    json::ObjectBuilder b;
    b.Set("metadata", metadata.ToJSON())
     .Set("registeredAt", json::FormatTimestamp(registeredAt))
     .Set("usageCount", usageCount)
     .Set("isActive", isActive);
    if (lastUsed.has_value()) b.Set("lastUsed", json::FormatTimestamp(*lastUsed));
    else b.SetNull("lastUsed");
    if (validationResults.has_value()) b.Set("validationResults", validationResults->ToJSON());
    if (parameters) b.Set("inputSchema", parameters->ToJsonSchema());
    return b.Build();
}

JSONValue UsageStatistics::ToJSON() const {
    auto usageJSON = [](const std::optional<ToolUsage>& u) {
        if (!u.has_value()) return JSONValue(nullptr);
        return json::ObjectBuilder().Set("name", u->name).Set("usage", u->usage).Build();
    };
    json::ObjectBuilder cats;
    for (const auto& kv : categoryCounts) cats.Set(kv.first, static_cast<uint64_t>(kv.second));
    json::ObjectBuilder tagsB;
    for (const auto& kv : tagCounts) tagsB.Set(kv.first, static_cast<uint64_t>(kv.second));
    return json::ObjectBuilder()
        .Set("totalTools", static_cast<uint64_t>(totalTools))
        .Set("activeTools", static_cast<uint64_t>(activeTools))
        .Set("totalUsage", totalUsage)
        .Set("mostUsedTool", usageJSON(mostUsedTool))
        .Set("leastUsedTool", usageJSON(leastUsedTool))
        .Set("categoryCounts", cats.Build())
        .Set("tagCounts", tagsB.Build())
        .Build();
}

JSONValue RegistryHealth::ToJSON() const {
    return json::ObjectBuilder()
        .Set("status", toString(status))
        .Set("totalTools", static_cast<uint64_t>(totalTools))
        .Set("activeTools", static_cast<uint64_t>(activeTools))
        .Set("inactiveTools", static_cast<uint64_t>(inactiveTools))
        .Set("toolsWithIssues", static_cast<uint64_t>(toolsWithIssues))
        .Set("issues", issues)
        .Build();
}

} // namespace registry
} // namespace toolhost
