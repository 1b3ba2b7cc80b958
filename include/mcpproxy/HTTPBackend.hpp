//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPBackend.hpp
// Purpose: HTTP/HTTPS MCP backend: one JSON-RPC POST per round trip using Boost.Beast coroutines
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "mcpproxy/Envelope.h"
#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {

//==========================================================================================================
// HTTPBackend
// Purpose: Forwards ToolRequests to a remote MCP endpoint. Owns a private io_context served by one worker
//          thread; every round trip is an independent connection (Connection: close), so the backend is
//          stateless between calls. The configured timeout bounds each round trip as a whole.
//==========================================================================================================
class HTTPBackend {
public:
    //==========================================================================================================
    // Options
    // Purpose: Endpoint and limits.
    // Fields:
    //   url: http:// or https:// URL of the MCP endpoint (trailing '/' is trimmed)
    //   timeoutMs: Deadline for one round trip (resolve, connect, TLS, write, read)
    //   caFile: Optional PEM bundle used instead of the system trust store for https
    //   bodyLimit: Maximum accepted response body size in bytes
    //==========================================================================================================
    struct Options {
        std::string url;
        unsigned int timeoutMs{30000};
        std::string caFile;
        std::size_t bodyLimit{64u * 1024u * 1024u};
    };

    //==========================================================================================================
    // HttpReply
    // Purpose: Status and complete body of one HTTP exchange.
    //==========================================================================================================
    struct HttpReply {
        int status{0};
        std::string contentType;
        std::string body;
    };

    // Throws errors::ConfigError when the URL scheme is neither http nor https or the CA file is unusable.
    explicit HTTPBackend(const Options& opts);
    HTTPBackend(HTTPBackend&&) noexcept;
    HTTPBackend& operator=(HTTPBackend&&) noexcept;
    ~HTTPBackend();

    //==========================================================================================================
    // Starts the I/O worker thread. Called implicitly by the first round trip.
    //==========================================================================================================
    void Start();

    //==========================================================================================================
    // Stops the I/O worker thread. Safe to call more than once.
    //==========================================================================================================
    void Close();

    //==========================================================================================================
    // Post
    // Purpose: Sends one POST with the JSON body and returns the full reply without interpreting it.
    // Throws:
    //   errors::BackendError(HttpFailure) on resolve/connect/TLS/I/O failure or timeout.
    //==========================================================================================================
    HttpReply Post(const std::string& jsonBody);

    //==========================================================================================================
    // RoundTrip
    // Purpose: Wraps the request in the backend envelope, posts it, and normalizes the reply.
    //          A non-2xx status is logged but does not fail the call.
    // Throws:
    //   errors::BackendError (HttpFailure, EmptyBody, NoSseData, JsonParseError).
    //==========================================================================================================
    JSONValue RoundTrip(const ToolRequest& request);

    // Human-readable target for diagnostics.
    std::string Describe() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpproxy
