//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read TOOLHOST_* environment variables safely.
//==========================================================================================================
#pragma once
#include <charconv>
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

// "1", "true", "TRUE", "yes" are on; anything else set is off.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

//==========================================================================================================
// ParseEnvInteger
// Purpose: Parses a non-negative integer environment value.
// Returns:
//   std::nullopt when the variable is unset; the parsed value otherwise.
//   Sets *malformed to true (when provided) if the variable is set but is not a non-negative integer.
//==========================================================================================================
inline std::optional<long long> ParseEnvInteger(const char* name, bool* malformed = nullptr) {
    if (malformed) *malformed = false;
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return std::nullopt;
    }
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size() || out < 0) {
        if (malformed) *malformed = true;
        return std::nullopt;
    }
    return out;
}
