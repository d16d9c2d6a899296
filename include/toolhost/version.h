//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the protocol revision advertised during initialize.
//==========================================================================================================
#pragma once

#include <string>

#define TOOLHOST_VERSION_MAJOR 1
#define TOOLHOST_VERSION_MINOR 0
#define TOOLHOST_VERSION_PATCH 0

namespace toolhost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Protocol revision reported in the initialize result.
constexpr const char* kProtocolVersion = "2024-11-05";

// Framework name reported by server_info.
constexpr const char* kFrameworkName = "toolhost";

} // namespace toolhost
