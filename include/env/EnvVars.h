//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPPROXY_* environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set or is set to an empty string.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
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

//==========================================================================================================
// IsEnvFlagSet
// Purpose: Interprets an environment variable as a boolean switch ("1", "true", "TRUE", "yes").
// Args:
//   name: Environment variable name.
//   defaultValue: Result when the variable is unset.
//==========================================================================================================
inline bool IsEnvFlagSet(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}
