//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxySession.h
// Purpose: Request dispatcher: reads JSON-RPC lines, routes them, writes one response per request
//==========================================================================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "mcpproxy/Backend.h"
#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {

// MCP protocol revision announced by initialize.
constexpr const char* kProtocolVersion = "2024-11-05";

//==========================================================================================================
// SessionState
// Purpose: Where the loop is. Idle before Run(), Finished after end of input.
//==========================================================================================================
enum class SessionState {
    Idle,
    AwaitingLine,
    Dispatch,
    Respond,
    Skip,
    Finished
};

//==========================================================================================================
// ProxySession
// Purpose: Owns one strictly sequential session over an input and an output stream. The next line is not
//          read until the current one has been answered or skipped, so responses come out in input order.
//          Backend failures become JSON-RPC errors; only end of input ends the loop.
//==========================================================================================================
class ProxySession {
public:
    ProxySession(Backend& backend, std::istream& in, std::ostream& out);

    //==========================================================================================================
    // Run
    // Purpose: Processes lines until end of input (or until the output stream fails).
    // Returns:
    //   Number of response lines written.
    //==========================================================================================================
    std::size_t Run();

    //==========================================================================================================
    // HandleLine
    // Purpose: Processes one raw input line.
    // Returns:
    //   The serialized response (no trailing newline), or std::nullopt for blank lines, malformed lines
    //   and notifications.
    //==========================================================================================================
    std::optional<std::string> HandleLine(const std::string& line);

    //==========================================================================================================
    // Dispatch
    // Purpose: Routes a parsed request by method.
    // Returns:
    //   The response, or nullptr when the request is a notification.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONRPCRequest& request);

    SessionState State() const { return state_; }

    // The fixed initialize result (protocol version, capabilities, server info).
    static JSONValue InitializeResult();

private:
    std::unique_ptr<JSONRPCResponse> forward(const JSONRPCRequest& request);

    Backend& backend_;
    std::istream& in_;
    std::ostream& out_;
    SessionState state_{SessionState::Idle};
};

} // namespace mcpproxy
