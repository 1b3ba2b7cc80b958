//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed backend/config failures and JSON-RPC error mapping helpers for mcp-proxy
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {
namespace errors {

// Ways a backend round trip can fail. All of them surface to the caller as InternalError.
enum class ErrorKind {
    EmptyBody,       // HTTP body (or backend line) blank after trimming
    NoSseData,       // SSE-framed body without a "data: " line
    JsonParseError,  // backend payload is not valid JSON
    HttpFailure,     // resolve/connect/TLS/read/write/timeout on the HTTP backend
    ProcessIoError,  // write/read failure on the child process pipes, or the child is gone
    SocketFailure    // Unix-domain socket / FIFO failure
};

// Stable name of an ErrorKind for diagnostics.
inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyBody: return "EmptyBody";
        case ErrorKind::NoSseData: return "NoSseData";
        case ErrorKind::JsonParseError: return "JsonParseError";
        case ErrorKind::HttpFailure: return "HttpFailure";
        case ErrorKind::ProcessIoError: return "ProcessIoError";
        case ErrorKind::SocketFailure: return "SocketFailure";
    }
    return "Unknown";
}

//==========================================================================================================
// BackendError
// Purpose: Raised by the backends and the response normalizer. what() is the human-readable description
//          that ends up in the "Internal error: ..." message sent to the caller.
//==========================================================================================================
class BackendError : public std::runtime_error {
public:
    BackendError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

//==========================================================================================================
// ConfigError
// Purpose: Startup misconfiguration (no target, conflicting targets, bad flag values).
//==========================================================================================================
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

// Typed view of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.Find("code");
    const JSONValue* msgVal = errVal.Find("message");
    if (!codeVal || !msgVal) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) || !msgVal->IsString()) {
        return std::nullopt;
    }

    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeVal->value));
    e.message = std::get<std::string>(msgVal->value);
    if (const JSONValue* dataVal = errVal.Find("data")) {
        e.data = *dataVal;
    }
    return e;
}

} // namespace errors
} // namespace mcpproxy
