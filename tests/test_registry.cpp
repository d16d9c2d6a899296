//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: GoogleTests for tool registration, discovery, metadata updates, usage and health
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "toolhost/JSONHelpers.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/ToolRegistry.hpp"

using namespace toolhost;
using namespace toolhost::registry;

namespace {

ToolInvoker noopInvoker() {
    return [](const JSONValue&) -> errors::ToolOutcome { return errors::ToolSuccess{json::EmptyObject()}; };
}

ToolMetadata makeTool(const std::string& name, const std::string& category,
                      std::vector<std::string> tags = {}, std::optional<Complexity> complexity = std::nullopt) {
    ToolMetadata m;
    m.name = name;
    m.description = "Tool " + name;
    m.version = "1.0.0";
    m.category = category;
    m.tags = std::move(tags);
    m.documentation = "docs";
    if (complexity) {
        PerformanceHints p;
        p.complexity = complexity;
        m.performance = p;
    }
    return m;
}

std::vector<std::string> names(const std::vector<RegisteredTool>& tools) {
    std::vector<std::string> out;
    for (const auto& t : tools) out.push_back(t.metadata.name);
    return out;
}

} // namespace

TEST(ToolRegistryTest, RegisterAndLookup) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("alpha", "system", {"health"}), nullptr, noopInvoker());

    EXPECT_TRUE(reg.HasTool("alpha"));
    EXPECT_EQ(reg.Size(), 1u);
    auto t = reg.GetTool("alpha");
    ASSERT_TRUE(t.has_value());
    EXPECT_TRUE(t->isActive);
    EXPECT_EQ(t->usageCount, 0u);
    EXPECT_FALSE(t->lastUsed.has_value());
    ASSERT_NE(t->parameters, nullptr);
    EXPECT_TRUE(t->parameters->Validate(json::EmptyObject()).ok);
    ASSERT_TRUE(t->validationResults.has_value());
    EXPECT_TRUE(t->validationResults->isValid);
    EXPECT_FALSE(reg.GetTool("missing").has_value());
}

TEST(ToolRegistryTest, DuplicateRejectedUnlessReplacing) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("alpha", "system"), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("beta", "system"), nullptr, noopInvoker());
    reg.RecordToolUsage("alpha");

    EXPECT_THROW(reg.RegisterTool(makeTool("alpha", "other"), nullptr, noopInvoker()), errors::RegistrationError);

    RegistrationOptions replace;
    replace.replaceExisting = true;
    reg.RegisterTool(makeTool("alpha", "other"), nullptr, noopInvoker(), replace);

    EXPECT_EQ(reg.Size(), 2u);
    auto all = reg.GetAllTools();
    EXPECT_EQ(names(all), (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_EQ(all[0].metadata.category, "other");
    EXPECT_EQ(all[0].usageCount, 0u);
}

TEST(ToolRegistryTest, ValidationErrorsBlockRegistration) {
    ToolRegistry reg;
    ToolMetadata bad = makeTool("bad name!", "system");
    bad.description = "  ";
    try {
        reg.RegisterTool(bad, nullptr, noopInvoker());
        FAIL() << "expected RegistrationError";
    } catch (const errors::RegistrationError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("Tool description is required"), std::string::npos);
        EXPECT_NE(msg.find("alphanumeric"), std::string::npos);
    }
    EXPECT_EQ(reg.Size(), 0u);

    RegistrationOptions lax;
    lax.validateOnRegistration = false;
    reg.RegisterTool(bad, nullptr, noopInvoker(), lax);
    EXPECT_TRUE(reg.HasTool("bad name!"));
    EXPECT_FALSE(reg.GetTool("bad name!")->validationResults.has_value());
}

TEST(ToolRegistryTest, ValidateToolWarnings) {
    ToolRegistry reg;
    ToolMetadata m = makeTool("gamma", "system");
    m.version = "v1";
    m.documentation.reset();
    ValidationResult r = reg.ValidateTool(m, nullptr);
    EXPECT_TRUE(r.isValid);
    EXPECT_EQ(r.warnings.size(), 3u);
}

TEST(ToolRegistryTest, DiscoverFiltersConjunctivelyAndSortsByName) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("zeta_health", "system", {"health", "monitoring"}, Complexity::Low), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("alpha_health", "system", {"health"}, Complexity::High), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("registry_list", "registry", {"health", "monitoring"}), nullptr, noopInvoker());

    EXPECT_EQ(names(reg.DiscoverTools()), (std::vector<std::string>{"alpha_health", "registry_list", "zeta_health"}));

    ToolFilter byTags;
    byTags.tags = std::vector<std::string>{"health", "monitoring"};
    EXPECT_EQ(names(reg.DiscoverTools(byTags)), (std::vector<std::string>{"registry_list", "zeta_health"}));

    ToolFilter combined;
    combined.category = "system";
    combined.tags = std::vector<std::string>{"monitoring"};
    EXPECT_EQ(names(reg.DiscoverTools(combined)), std::vector<std::string>{"zeta_health"});

    ToolFilter byName;
    byName.name = "HEALTH";
    EXPECT_EQ(reg.DiscoverTools(byName).size(), 2u);

    ToolFilter byComplexity;
    byComplexity.complexity = Complexity::High;
    EXPECT_EQ(names(reg.DiscoverTools(byComplexity)), std::vector<std::string>{"alpha_health"});

    ToolFilter withExamples;
    withExamples.hasExamples = true;
    EXPECT_TRUE(reg.DiscoverTools(withExamples).empty());
}

TEST(ToolRegistryTest, FilterFromJSONAndCacheKey) {
    ToolFilter f = ToolFilter::FromJSON(ParseJSON(R"({"category":"system","tags":["a","b"],"isActive":true})"));
    ASSERT_TRUE(f.category.has_value());
    EXPECT_EQ(*f.category, "system");
    ASSERT_TRUE(f.isActive.has_value());
    EXPECT_TRUE(*f.isActive);
    ASSERT_TRUE(f.tags.has_value());
    EXPECT_EQ(f.tags->size(), 2u);

    ToolFilter same = ToolFilter::FromJSON(ParseJSON(R"({"isActive":true,"tags":["a","b"],"category":"system"})"));
    EXPECT_EQ(f.CacheKey(), same.CacheKey());
    EXPECT_NE(f.CacheKey(), ToolFilter{}.CacheKey());
    EXPECT_THROW(ToolFilter::FromJSON(ParseJSON(R"({"complexity":"extreme"})")), std::invalid_argument);
}

TEST(ToolRegistryTest, CacheKeySeparatesPresenceAndValues) {
    auto key = [](const char* text) { return ToolFilter::FromJSON(ParseJSON(text)).CacheKey(); };
    EXPECT_NE(key(R"({"name":"*"})"), key("{}"));
    EXPECT_NE(key(R"({"category":"*"})"), key("{}"));
    EXPECT_NE(key(R"({"tags":["a,b"]})"), key(R"({"tags":["a","b"]})"));
    EXPECT_NE(key(R"({"tags":[]})"), key("{}"));
    EXPECT_NE(key(R"({"name":"x"})"), key(R"({"category":"x"})"));
    EXPECT_EQ(key(R"({"isActive":false,"name":"a|b"})"), key(R"({"name":"a|b","isActive":false})"));
}

TEST(ToolRegistryTest, ActivationAndUnknownTools) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("alpha", "system"), nullptr, noopInvoker());

    reg.SetToolActive("alpha", false);
    EXPECT_FALSE(reg.GetTool("alpha")->isActive);

    ToolFilter active;
    active.isActive = true;
    EXPECT_TRUE(reg.DiscoverTools(active).empty());

    EXPECT_THROW(reg.SetToolActive("missing", true), errors::NotFoundError);
    EXPECT_THROW(reg.UnregisterTool("missing"), errors::NotFoundError);
    EXPECT_THROW(reg.UpdateToolMetadata("missing", ToolMetadataPatch{}), errors::NotFoundError);

    RegistrationOptions inactive;
    inactive.autoActivate = false;
    reg.RegisterTool(makeTool("beta", "system"), nullptr, noopInvoker(), inactive);
    EXPECT_FALSE(reg.GetTool("beta")->isActive);
}

TEST(ToolRegistryTest, MetadataPatchKeepsAbsentFieldsAndAccumulatesTags) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("alpha", "system", {"health"}), nullptr, noopInvoker());

    ToolMetadataPatch patch = ToolMetadataPatch::FromJSON(
        ParseJSON(R"({"name":"renamed","description":"Updated","tags":["diagnostics"]})"));
    EXPECT_EQ(patch.FieldNames(), (std::vector<std::string>{"description", "tags"}));
    reg.UpdateToolMetadata("alpha", patch);

    auto t = reg.GetTool("alpha");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->metadata.name, "alpha");
    EXPECT_EQ(t->metadata.description, "Updated");
    EXPECT_EQ(t->metadata.category, "system");
    EXPECT_EQ(t->metadata.version, "1.0.0");
    EXPECT_EQ(t->metadata.tags, std::vector<std::string>{"diagnostics"});

    // Previously seen tags stay in the accumulated set.
    EXPECT_EQ(reg.GetTags(), (std::vector<std::string>{"diagnostics", "health"}));
}

TEST(ToolRegistryTest, MetadataPatchRejectsWrongTypes) {
    EXPECT_THROW(ToolMetadataPatch::FromJSON(ParseJSON(R"({"tags":"single"})")), std::invalid_argument);
    EXPECT_THROW(ToolMetadataPatch::FromJSON(ParseJSON(R"({"description":5})")), std::invalid_argument);
    EXPECT_THROW(ToolMetadataPatch::FromJSON(ParseJSON("[]")), std::invalid_argument);
}

TEST(ToolRegistryTest, UnregisterKeepsCategoriesAndOrder) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("a", "one"), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("b", "two"), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("c", "three"), nullptr, noopInvoker());

    reg.UnregisterTool("b");
    EXPECT_FALSE(reg.HasTool("b"));
    EXPECT_EQ(names(reg.GetAllTools()), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(reg.GetCategories(), (std::vector<std::string>{"one", "three", "two"}));

    reg.Clear();
    EXPECT_EQ(reg.Size(), 0u);
    EXPECT_TRUE(reg.GetCategories().empty());
    EXPECT_TRUE(reg.GetTags().empty());
}

TEST(ToolRegistryTest, UsageStatisticsRanking) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("a", "system", {"x"}), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("b", "system", {"x", "y"}), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("c", "registry"), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("d", "registry"), nullptr, noopInvoker());

    reg.RecordToolUsage("a");
    reg.RecordToolUsage("b");
    reg.RecordToolUsage("c");
    reg.RecordToolUsage("c");
    reg.RecordToolUsage("unknown");

    UsageStatistics s = reg.GetUsageStatistics();
    EXPECT_EQ(s.totalTools, 4u);
    EXPECT_EQ(s.activeTools, 4u);
    EXPECT_EQ(s.totalUsage, 4u);
    ASSERT_TRUE(s.mostUsedTool.has_value());
    EXPECT_EQ(s.mostUsedTool->name, "c");
    EXPECT_EQ(s.mostUsedTool->usage, 2u);
    ASSERT_TRUE(s.leastUsedTool.has_value());
    EXPECT_EQ(s.leastUsedTool->name, "b");
    EXPECT_EQ(s.categoryCounts["system"], 2u);
    EXPECT_EQ(s.tagCounts["x"], 2u);
    EXPECT_TRUE(reg.GetTool("c")->lastUsed.has_value());
    EXPECT_FALSE(reg.GetTool("d")->lastUsed.has_value());
}

TEST(ToolRegistryTest, UsageStatisticsWithoutUsage) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("a", "system"), nullptr, noopInvoker());
    UsageStatistics s = reg.GetUsageStatistics();
    EXPECT_FALSE(s.mostUsedTool.has_value());
    EXPECT_FALSE(s.leastUsedTool.has_value());
}

TEST(ToolRegistryTest, HealthWarnsWhenMostToolsInactive) {
    ToolRegistry reg;
    EXPECT_EQ(reg.GetHealthStatus().status, HealthLevel::Healthy);

    reg.RegisterTool(makeTool("a", "system"), nullptr, noopInvoker());
    reg.RegisterTool(makeTool("b", "system"), nullptr, noopInvoker());
    reg.SetToolActive("a", false);
    EXPECT_EQ(reg.GetHealthStatus().status, HealthLevel::Healthy);

    reg.SetToolActive("b", false);
    RegistryHealth h = reg.GetHealthStatus();
    EXPECT_EQ(h.status, HealthLevel::Warning);
    EXPECT_EQ(h.inactiveTools, 2u);
    EXPECT_EQ(h.activeTools, 0u);
    ASSERT_FALSE(h.issues.empty());

    JSONValue j = h.ToJSON();
    EXPECT_EQ(json::GetString(j, "status").value_or(""), "warning");
}

TEST(ToolRegistryTest, ConcurrentUsageIsNotLost) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("hot", "system"), nullptr, noopInvoker());

    constexpr int kThreads = 16;
    constexpr int kCallsPerThread = 1000;
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([&reg] {
            for (int n = 0; n < kCallsPerThread; ++n) reg.RecordToolUsage("hot");
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(reg.GetTool("hot")->usageCount, static_cast<uint64_t>(kThreads * kCallsPerThread));
    EXPECT_EQ(reg.GetUsageStatistics().totalUsage, static_cast<uint64_t>(kThreads * kCallsPerThread));
}

TEST(ToolRegistryTest, LastUsedTracksMostRecentCall) {
    ToolRegistry reg;
    reg.RegisterTool(makeTool("timed", "system"), nullptr, noopInvoker());

    reg.RecordToolUsage("timed");
    const TimePoint first = *reg.GetTool("timed")->lastUsed;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    const TimePoint before = std::chrono::system_clock::now();
    reg.RecordToolUsage("timed");
    const TimePoint after = std::chrono::system_clock::now();

    auto tool = reg.GetTool("timed");
    ASSERT_TRUE(tool->lastUsed.has_value());
    EXPECT_GE(*tool->lastUsed, before);
    EXPECT_LE(*tool->lastUsed, after);
    EXPECT_GT(*tool->lastUsed, first);
    EXPECT_EQ(tool->usageCount, 2u);
}
