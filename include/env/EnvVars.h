//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely (strings and unsigned integers).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUintOrDefault
// Purpose: Reads an unsigned integer environment variable; malformed or empty values yield the default.
// Args:
//   name: Environment variable name.
//   defaultValue: Fallback value.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUintOrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    uint64_t out = 0;
    for (char c : v) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
        out = out * 10u + static_cast<uint64_t>(c - '0');
    }
    return out;
}
