//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely, with typed accessors for host tunables.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
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
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUint64
// Purpose: Reads an unsigned integer variable; malformed or missing values yield defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUint64(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != v.size()) {
            return defaultValue;
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

// "1", "true", "yes", "on" (any case) are true; anything else is false; unset yields defaultValue.
inline bool GetEnvBool(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    for (auto& c : v) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
