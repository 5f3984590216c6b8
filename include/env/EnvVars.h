//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPLINK_* environment variables with typed defaults.
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
// GetEnvFlag
// Purpose: Interprets "1"/"true"/"TRUE"/"yes" as true; anything else (or unset) as defaultValue when unset.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Parses an unsigned integer environment value; malformed values fall back to defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUInt64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(v.c_str(), &end, 10);
    if (end == v.c_str() || (end && *end != '\0')) {
        return defaultValue;
    }
    return static_cast<uint64_t>(parsed);
}
