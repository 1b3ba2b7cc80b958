//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelope.cpp
// Purpose: JSON-RPC envelope build/unwrap rules for backend round trips
//==========================================================================================================

#include "mcpproxy/Envelope.h"
#include "mcpproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpproxy {

ToolRequest MakeToolRequest(const JSONRPCRequest& inbound) {
    FUNC_SCOPE();
    ToolRequest req;
    req.method = inbound.method;
    if (inbound.method == Methods::CallTool && inbound.params.has_value() &&
        !std::holds_alternative<std::nullptr_t>(inbound.params->value)) {
        req.params = inbound.params.value();
    } else {
        req.params = JSONValue(JSONValue::Object{});
    }
    return req;
}

JSONRPCRequest BuildBackendEnvelope(const ToolRequest& request) {
    FUNC_SCOPE();
    return JSONRPCRequest(JSONRPCId(kBackendRequestId), request.method, request.params);
}

JSONValue UnwrapBackendResult(const JSONValue& normalized) {
    FUNC_SCOPE();
    if (const JSONValue* inner = normalized.Find("result")) {
        return *inner;
    }
    return normalized;
}

std::unique_ptr<JSONRPCResponse> MakeProxyResponse(const JSONRPCId& id, const JSONValue& normalized) {
    FUNC_SCOPE();
    if (!normalized.Find("result")) {
        if (const JSONValue* err = normalized.Find("error")) {
            if (auto typed = errors::mcpErrorFromErrorValue(*err); typed.has_value()) {
                LOG_WARN("Backend replied with JSON-RPC error {}: {}", typed->code, typed->message);
                return std::make_unique<JSONRPCResponse>(id, *err, true);
            }
        }
    }
    return std::make_unique<JSONRPCResponse>(id, UnwrapBackendResult(normalized));
}

std::unique_ptr<JSONRPCResponse> MakeInternalErrorResponse(const JSONRPCId& id, const std::exception& failure) {
    return CreateErrorResponse(id, JSONRPCErrorCodes::InternalError,
                               std::string("Internal error: ") + failure.what());
}

std::unique_ptr<JSONRPCResponse> MakeMethodNotFoundResponse(const JSONRPCId& id, const std::string& method) {
    return CreateErrorResponse(id, JSONRPCErrorCodes::MethodNotFound,
                               std::string("Method not found: ") + method);
}

} // namespace mcpproxy
