//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Environment lookups shared by the logger and the configuration loader.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOptional
// Purpose: Reads a variable, treating unset and empty the same way.
// Returns:
//   The value, or std::nullopt when name is null/empty or the variable is unset or empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const char* name) {
    if (name == nullptr || *name == '\0') return std::nullopt;
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return std::nullopt;
    return std::string(raw);
}

// GetEnvOptional with a fallback.
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    return GetEnvOptional(name).value_or(defaultValue);
}

// Spellings accepted for boolean switches in the environment and on the command line.
inline bool IsTruthyEnvValue(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "True" || v == "yes" || v == "on";
}

inline bool IsFalsyEnvValue(const std::string& v) {
    return v == "0" || v == "false" || v == "FALSE" || v == "False" || v == "no" || v == "off";
}
