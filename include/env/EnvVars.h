//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MEMGATE_* environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

// Parses a non-negative integer variable; malformed values fall back to defaultValue.
inline std::uint64_t GetEnvUIntOrDefault(const char* name, std::uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 19) {
        return defaultValue;
    }
    return static_cast<std::uint64_t>(std::stoull(v));
}

// "1", "true", "yes", "on" (any case) are true; "0", "false", "no", "off" are false.
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defaultValue;
}
