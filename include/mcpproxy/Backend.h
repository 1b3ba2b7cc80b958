//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Backend.h
// Purpose: The closed set of backends and the single round-trip dispatch over them
//==========================================================================================================

#pragma once

#include <string>
#include <variant>

#include "mcpproxy/Envelope.h"
#include "mcpproxy/HTTPBackend.hpp"
#include "mcpproxy/JSONRPCTypes.h"
#include "mcpproxy/ProcessBackend.hpp"
#include "mcpproxy/ProxyConfig.h"
#include "mcpproxy/SocketBackend.hpp"

namespace mcpproxy {

//==========================================================================================================
// Backend
// Purpose: Exactly one of the three backends, chosen at startup and never switched during a run.
//==========================================================================================================
using Backend = std::variant<HTTPBackend, ProcessBackend, SocketBackend>;

//==========================================================================================================
// CreateBackend
// Purpose: Builds the backend selected by the configuration. Nothing is connected or spawned yet.
// Throws:
//   errors::ConfigError when no target is selected or the target is unusable (e.g. bad URL scheme).
//==========================================================================================================
Backend CreateBackend(const ProxyConfig& config);

//==========================================================================================================
// StartBackend
// Purpose: Acquires long-lived resources (HTTP worker thread, child process). The socket backend has none.
// Throws:
//   errors::BackendError when the child process cannot be spawned.
//==========================================================================================================
void StartBackend(Backend& backend);

// Releases everything StartBackend acquired. Safe to call more than once.
void CloseBackend(Backend& backend);

//==========================================================================================================
// RoundTrip
// Purpose: Sends one ToolRequest to whichever backend is active and returns its normalized reply.
// Throws:
//   errors::BackendError on any transport or payload failure.
//==========================================================================================================
JSONValue RoundTrip(Backend& backend, const ToolRequest& request);

std::string DescribeBackend(const Backend& backend);

} // namespace mcpproxy
