//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcp-proxy entry point: stdin/stdout JSON-RPC session in front of one MCP backend
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "mcpproxy/Backend.h"
#include "mcpproxy/ProxyConfig.h"
#include "mcpproxy/ProxySession.h"
#include "mcpproxy/errors/Errors.h"
#include "mcpproxy/version.h"
#include <csignal>
#include <optional>
#include <iostream>

using namespace mcpproxy;

//==========================================================================================================
// configureLogging
// Purpose: --verbose selects DEBUG; MCPPROXY_LOG_LEVEL and MCPPROXY_LOG_FILE override/extend it.
//==========================================================================================================
static void configureLogging(const ProxyConfig& cfg) {
    Logger::setLogLevel(cfg.verbose ? LogLevel::LOG_DEBUG_LEVEL : LogLevel::LOG_WARN_LEVEL);
    const std::string level = GetEnvOrDefault("MCPPROXY_LOG_LEVEL", "");
    if (!level.empty()) {
        Logger::setLogLevelFromString(level);
    }
    const std::string file = GetEnvOrDefault("MCPPROXY_LOG_FILE", "");
    if (!file.empty()) {
        Logger::setLogFile(file);
    }
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    std::signal(SIGPIPE, SIG_IGN);
    std::ios::sync_with_stdio(false);

    ProxyConfig cfg;
    try {
        cfg = ParseProxyArgs(argc, argv);
    } catch (const errors::ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << ProxyUsage(argv[0]);
        return 2;
    }
    if (cfg.showHelp) {
        std::cout << ProxyUsage(argv[0]);
        return 0;
    }
    if (cfg.showVersion) {
        std::cout << kServerName << " " << getVersionString() << std::endl;
        return 0;
    }
    configureLogging(cfg);

    std::optional<Backend> backend;
    try {
        backend.emplace(CreateBackend(cfg));
        StartBackend(*backend);
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start backend: {}", e.what());
        return 1;
    }

    LOG_INFO("Starting {} {}", kServerName, getVersionString());
    LOG_INFO("Target MCP server: {}", DescribeBackend(*backend));

    ProxySession session(*backend, std::cin, std::cout);
    const std::size_t responses = session.Run();
    LOG_INFO("End of input after {} responses", responses);

    CloseBackend(*backend);
    return 0;
}
