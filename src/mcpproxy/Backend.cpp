//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Backend.cpp
// Purpose: Backend construction from configuration and variant dispatch
//==========================================================================================================

#include <type_traits>

#include "mcpproxy/Backend.h"
#include "mcpproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpproxy {

Backend CreateBackend(const ProxyConfig& config) {
    FUNC_SCOPE();
    switch (config.target) {
        case TargetKind::Http: {
            HTTPBackend::Options opts;
            opts.url = config.url;
            opts.timeoutMs = config.timeoutSeconds * 1000u;
            opts.caFile = config.caFile;
            return Backend(std::in_place_type<HTTPBackend>, opts);
        }
        case TargetKind::Process: {
            ProcessBackend::Options opts;
            opts.command = config.command;
            opts.args = config.commandArgs;
            return Backend(std::in_place_type<ProcessBackend>, opts);
        }
        case TargetKind::Socket: {
            SocketBackend::Options opts;
            opts.path = config.socketPath;
            return Backend(std::in_place_type<SocketBackend>, opts);
        }
        case TargetKind::None:
            break;
    }
    throw errors::ConfigError("No target selected: pass one of --url, --command or --pipe");
}

void StartBackend(Backend& backend) {
    FUNC_SCOPE();
    std::visit([](auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, HTTPBackend> || std::is_same_v<T, ProcessBackend>) {
            b.Start();
        }
    }, backend);
}

void CloseBackend(Backend& backend) {
    FUNC_SCOPE();
    std::visit([](auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, HTTPBackend> || std::is_same_v<T, ProcessBackend>) {
            b.Close();
        }
    }, backend);
}

JSONValue RoundTrip(Backend& backend, const ToolRequest& request) {
    FUNC_SCOPE();
    return std::visit([&request](auto& b) { return b.RoundTrip(request); }, backend);
}

std::string DescribeBackend(const Backend& backend) {
    return std::visit([](const auto& b) { return b.Describe(); }, backend);
}

} // namespace mcpproxy
