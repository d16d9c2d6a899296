//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SystemTools.hpp
// Purpose: Built-in tools for health, server information, discovery, registry management and lifecycle
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "toolhost/server/ToolServer.hpp"

namespace toolhost {
namespace tools {

//==========================================================================================================
// RegisterSystemTools
// Purpose: Registers health_check, server_info, tool_discovery, registry_status, registry_activate_tool,
//          registry_update_metadata and server_lifecycle on the server.
// Notes:
//   The tools hold a reference to server; it must outlive them. Throws errors::RegistrationError when a
//   system tool name is already taken.
//==========================================================================================================
void RegisterSystemTools(server::ToolServer& server);

// Names registered by RegisterSystemTools, in registration order.
std::vector<std::string> SystemToolNames();

} // namespace tools
} // namespace toolhost
