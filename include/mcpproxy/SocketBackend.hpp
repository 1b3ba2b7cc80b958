//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SocketBackend.hpp
// Purpose: MCP backend reached through a Unix domain socket, with a named-pipe (FIFO) fallback
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "mcpproxy/Envelope.h"
#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {

//==========================================================================================================
// SocketBackend
// Purpose: Connects to the configured path for every round trip (no persistent connection), writes the
//          request line and reads one reply line. When the socket connect fails and the path is a FIFO,
//          the request is written to the FIFO and the reply read back from the same FIFO. That fallback
//          only works with a peer that alternates read-then-write on the FIFO; it is a compatibility shim.
//          Neither path has a timeout.
//==========================================================================================================
class SocketBackend {
public:
    struct Options {
        std::string path;
    };

    explicit SocketBackend(const Options& opts);
    SocketBackend(SocketBackend&&) noexcept;
    SocketBackend& operator=(SocketBackend&&) noexcept;
    ~SocketBackend();

    //==========================================================================================================
    // Exchange
    // Purpose: Sends one line (a newline is appended) and returns the reply line without its terminator.
    // Throws:
    //   errors::BackendError(SocketFailure) when neither the socket nor the FIFO path works.
    //==========================================================================================================
    std::string Exchange(const std::string& line);

    //==========================================================================================================
    // RoundTrip
    // Purpose: Envelopes the request, exchanges it, and parses the reply line as JSON.
    // Throws:
    //   errors::BackendError (SocketFailure, EmptyBody, JsonParseError).
    //==========================================================================================================
    JSONValue RoundTrip(const ToolRequest& request);

    std::string Describe() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpproxy
