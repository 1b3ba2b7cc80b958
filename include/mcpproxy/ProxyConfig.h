//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxyConfig.h
// Purpose: Immutable startup configuration for mcp-proxy and its command-line parser
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

namespace mcpproxy {

// Which backend a run talks to. Exactly one is selected per run.
enum class TargetKind {
    None,
    Http,
    Process,
    Socket
};

//==========================================================================================================
// ProxyConfig
// Purpose: Everything read from the command line, captured once and passed by const reference.
// Fields:
//   target: Selected backend kind (None only when showHelp/showVersion is set)
//   url: HTTP endpoint for TargetKind::Http
//   timeoutSeconds: HTTP round-trip timeout (the other backends have none)
//   caFile: Optional PEM bundle for https
//   command/commandArgs: Child process for TargetKind::Process
//   socketPath: Socket or FIFO path for TargetKind::Socket
//   verbose: Lowers the log level to DEBUG
//   showHelp/showVersion: Print and exit without selecting a target
//==========================================================================================================
struct ProxyConfig {
    TargetKind target{TargetKind::None};
    std::string url;
    unsigned int timeoutSeconds{30};
    std::string caFile;
    std::string command;
    std::vector<std::string> commandArgs;
    std::string socketPath;
    bool verbose{false};
    bool showHelp{false};
    bool showVersion{false};
};

//==========================================================================================================
// ParseProxyArgs
// Purpose: Parses argv into a ProxyConfig. Accepts "--flag value" and "--flag=value".
// Args:
//   argc/argv: As passed to main.
// Returns:
//   The validated configuration.
// Throws:
//   errors::ConfigError for unknown flags, missing values, bad timeouts, conflicting or missing targets.
//==========================================================================================================
ProxyConfig ParseProxyArgs(int argc, const char* const* argv);

// Splits a whitespace-separated argument string ("-m server --port 1") into words.
std::vector<std::string> SplitArgs(const std::string& args);

// Usage text printed by --help.
std::string ProxyUsage(const std::string& program);

} // namespace mcpproxy
