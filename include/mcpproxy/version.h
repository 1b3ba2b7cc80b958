//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for mcp-proxy (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcpproxy {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the proxy semantic version components.
VersionInfo getVersion();

// Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

// Server name reported in the initialize descriptor and the HTTP User-Agent.
constexpr const char* kServerName = "mcp-proxy";

} // namespace mcpproxy
