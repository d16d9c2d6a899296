//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers backed by the TOOLHOST_VERSION_* macros.
//==========================================================================================================
#include "toolhost/version.h"

namespace toolhost {

VersionInfo getVersion() {
    return VersionInfo{TOOLHOST_VERSION_MAJOR, TOOLHOST_VERSION_MINOR, TOOLHOST_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return std::to_string(v.major) + '.' + std::to_string(v.minor) + '.' + std::to_string(v.patch);
}

} // namespace toolhost
