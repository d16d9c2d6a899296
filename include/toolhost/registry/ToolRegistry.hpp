//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.hpp
// Purpose: Thread-safe catalog of registered tools with discovery, validation and usage statistics
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/registry/ToolTypes.h"

namespace toolhost {
namespace registry {

//==========================================================================================================
// ToolRegistry
// Purpose: Owns the RegisteredTool entries of one server process.
// Notes:
//   - All methods are safe to call concurrently. No lock is held while a tool runs; callers receive
//     snapshots (copies) of entries.
//   - Categories and tags are accumulated from every registration and metadata update. Unregistering
//     a tool does not remove them; only clear() resets them.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // RegisterTool
    // Purpose: Adds (or with replaceExisting, replaces) a tool.
    // Args:
    //   metadata: Descriptive data; metadata.name is the key.
    //   parameters: Parameter contract; nullptr is treated as an empty contract.
    //   invoker: Wrapped handler.
    //   options: Replacement, validation and activation switches.
    // Notes:
    //   Throws errors::RegistrationError for duplicates (without replaceExisting) or validation errors.
    //   A replaced tool keeps its position in registration order; its usage data restarts at zero.
    //==========================================================================================================
    void RegisterTool(const ToolMetadata& metadata,
                      std::shared_ptr<const IParameterContract> parameters,
                      ToolInvoker invoker,
                      const RegistrationOptions& options = {});

    //==========================================================================================================
    // ValidateTool
    // Purpose: Checks metadata without registering it. Errors block registration; warnings do not.
    //==========================================================================================================
    ValidationResult ValidateTool(const ToolMetadata& metadata,
                                  const std::shared_ptr<const IParameterContract>& parameters) const;

    // Matching tools sorted by name ascending.
    std::vector<RegisteredTool> DiscoverTools(const ToolFilter& filter = {}) const;

    std::optional<RegisteredTool> GetTool(const std::string& name) const;
    bool HasTool(const std::string& name) const;

    // All tools in registration order.
    std::vector<RegisteredTool> GetAllTools() const;

    // Sorted accumulated sets.
    std::vector<std::string> GetCategories() const;
    std::vector<std::string> GetTags() const;

    // Throws errors::NotFoundError when the tool is absent.
    void UpdateToolMetadata(const std::string& name, const ToolMetadataPatch& patch);
    void SetToolActive(const std::string& name, bool isActive);
    void UnregisterTool(const std::string& name);

    // Increments usageCount and stamps lastUsed. Unknown names are ignored.
    void RecordToolUsage(const std::string& name);

    //==========================================================================================================
    // GetUsageStatistics
    // Notes:
    //   most/least used are chosen among tools with usageCount > 0, ranked by usage descending; ties
    //   keep registration order (the earliest registered wins "most", the latest wins "least").
    //==========================================================================================================
    UsageStatistics GetUsageStatistics() const;

    RegistryHealth GetHealthStatus() const;

    void Clear();
    std::size_t Size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace registry
} // namespace toolhost
