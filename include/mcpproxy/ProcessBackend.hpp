//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessBackend.hpp
// Purpose: MCP backend running as a child process speaking line-delimited JSON-RPC over its stdio
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpproxy/Envelope.h"
#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {

//==========================================================================================================
// ProcessBackend
// Purpose: Owns one child process for the whole run. Each round trip writes one request line to the
//          child's stdin and reads exactly one line from its stdout. The child is never restarted: once it
//          dies every later round trip fails. Reads have no timeout; a silent child blocks the caller.
//==========================================================================================================
class ProcessBackend {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   command: Executable path, or a name resolved through PATH when it contains no '/'
    //   args: Arguments passed to the executable
    //   shutdownGrace: Time the child gets to exit after its stdin is closed before it is terminated
    //==========================================================================================================
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::chrono::milliseconds shutdownGrace{2000};
    };

    explicit ProcessBackend(const Options& opts);
    ProcessBackend(ProcessBackend&&) noexcept;
    ProcessBackend& operator=(ProcessBackend&&) noexcept;
    ~ProcessBackend();

    //==========================================================================================================
    // Start
    // Purpose: Spawns the child with piped stdin/stdout/stderr. No-op when already started.
    // Throws:
    //   errors::BackendError(ProcessIoError) when the command cannot be found or spawned.
    //==========================================================================================================
    void Start();

    //==========================================================================================================
    // Close
    // Purpose: Closes the child's stdin, waits up to shutdownGrace, terminates it if still alive, and reaps
    //          it. Safe to call more than once; also run by the destructor.
    //==========================================================================================================
    void Close();

    bool IsRunning() const;

    // Exit code once the child has been reaped.
    std::optional<int> ExitCode() const;

    //==========================================================================================================
    // RoundTrip
    // Purpose: Sends the enveloped request as one line and parses the next stdout line as the reply.
    //          Spawns the child first when Start() has not been called.
    // Throws:
    //   errors::BackendError (ProcessIoError, EmptyBody, JsonParseError).
    //==========================================================================================================
    JSONValue RoundTrip(const ToolRequest& request);

    std::string Describe() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpproxy
