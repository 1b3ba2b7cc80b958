//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelope.h
// Purpose: Translation between the caller-facing JSON-RPC envelope and the backend's internal envelope
//==========================================================================================================

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {

//==========================================================================================================
// ToolRequest
// Purpose: Transport-agnostic unit handed to a backend: a method and its params.
//==========================================================================================================
struct ToolRequest {
    std::string method;
    JSONValue params;
};

// Method names the session understands.
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

// Id used on every backend envelope. Calls are strictly sequential so it never correlates anything.
constexpr int64_t kBackendRequestId = 1;

//==========================================================================================================
// MakeToolRequest
// Purpose: Derives the backend request for tools/list (params forced to {}) or tools/call (params passed
//          through verbatim, {} when absent or null).
//==========================================================================================================
ToolRequest MakeToolRequest(const JSONRPCRequest& inbound);

//==========================================================================================================
// BuildBackendEnvelope
// Purpose: Wraps a ToolRequest as {"jsonrpc":"2.0","id":1,"method":...,"params":...}.
//==========================================================================================================
JSONRPCRequest BuildBackendEnvelope(const ToolRequest& request);

//==========================================================================================================
// UnwrapBackendResult
// Purpose: Returns the value of a top-level "result" member when present, else the whole value.
//==========================================================================================================
JSONValue UnwrapBackendResult(const JSONValue& normalized);

//==========================================================================================================
// MakeProxyResponse
// Purpose: Builds the caller-facing response for a normalized backend reply.
// Args:
//   id: The caller's original request id.
//   normalized: Backend reply after normalization.
// Returns:
//   A result response carrying UnwrapBackendResult(normalized). A reply that has no "result" member but a
//   well-formed top-level JSON-RPC "error" object is relayed as an error response instead.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> MakeProxyResponse(const JSONRPCId& id, const JSONValue& normalized);

// {"code":-32603,"message":"Internal error: <what>"} for a failed round trip.
std::unique_ptr<JSONRPCResponse> MakeInternalErrorResponse(const JSONRPCId& id, const std::exception& failure);

// {"code":-32601,"message":"Method not found: <method>"}.
std::unique_ptr<JSONRPCResponse> MakeMethodNotFoundResponse(const JSONRPCId& id, const std::string& method);

} // namespace mcpproxy
