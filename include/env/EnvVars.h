//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables, with typed fallbacks for numeric settings.
//==========================================================================================================
#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
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
// GetEnv
// Purpose: Distinguishes "unset" from "set to empty", which GetEnvOrDefault cannot.
//==========================================================================================================
inline std::optional<std::string> GetEnv(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const char* v = std::getenv(name.c_str());
    if (!v) {
        return std::nullopt;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Parses an unsigned integer variable; unset or malformed values yield defaultValue.
// Returns:
//   Parsed value, or defaultValue. Sets *malformed (when given) if a value was present but unusable.
//==========================================================================================================
inline uint64_t GetEnvUInt64OrDefault(const char* name, uint64_t defaultValue, bool* malformed = nullptr) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (malformed) {
        *malformed = false;
    }
    if (raw.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(raw.c_str(), &end, 10);
    if (errno != 0 || end == raw.c_str() || *end != '\0' || raw[0] == '-') {
        if (malformed) {
            *malformed = true;
        }
        return defaultValue;
    }
    return static_cast<uint64_t>(v);
}
