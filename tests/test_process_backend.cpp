//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_process_backend.cpp
// Purpose: ProcessBackend round trips against small /bin/sh stdio servers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "mcpproxy/ProcessBackend.hpp"
#include "mcpproxy/errors/Errors.h"

using namespace mcpproxy;

namespace {

// Replies to every line with {"result":{"echo":<line>}}
const char* kEchoServer =
    "while IFS= read -r line; do printf '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"echo\":%s}}\\n' \"$line\"; done";

ProcessBackend::Options shell(const std::string& script) {
    ProcessBackend::Options opts;
    opts.command = "/bin/sh";
    opts.args = {"-c", script};
    return opts;
}

ToolRequest callTool(const std::string& name) {
    return ToolRequest{"tools/call", ParseJSON(R"({"name":")" + name + R"(","arguments":{}})")};
}

errors::ErrorKind failureKind(ProcessBackend& backend) {
    try {
        (void)backend.RoundTrip(callTool("x"));
    } catch (const errors::BackendError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected BackendError";
    return errors::ErrorKind::HttpFailure;
}

} // namespace

TEST(ProcessBackend, RoundTripSendsEnvelopeAsOneLine) {
    ProcessBackend backend(shell(kEchoServer));
    backend.Start();
    ASSERT_TRUE(backend.IsRunning());

    JSONValue reply = backend.RoundTrip(callTool("echo"));
    const JSONValue* echo = reply.Find("result")->Find("echo");
    ASSERT_NE(echo, nullptr);
    EXPECT_EQ(*echo, ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{}}})"));

    JSONValue second = backend.RoundTrip(ToolRequest{"tools/list", JSONValue(JSONValue::Object{})});
    EXPECT_EQ(std::get<std::string>(second.Find("result")->Find("echo")->Find("method")->value), "tools/list");

    backend.Close();
    EXPECT_FALSE(backend.IsRunning());
    ASSERT_TRUE(backend.ExitCode().has_value());
    EXPECT_EQ(*backend.ExitCode(), 0);
}

TEST(ProcessBackend, SpawnsLazilyOnFirstRoundTrip) {
    ProcessBackend backend(shell(kEchoServer));
    EXPECT_FALSE(backend.IsRunning());
    JSONValue reply = backend.RoundTrip(callTool("lazy"));
    EXPECT_NE(reply.Find("result"), nullptr);
    EXPECT_TRUE(backend.IsRunning());
}

TEST(ProcessBackend, ChattyStderrDoesNotBlockReplies) {
    const std::string script = std::string("yes diagnostics | head -n 20000 >&2; ") + kEchoServer;
    ProcessBackend backend(shell(script));
    JSONValue reply = backend.RoundTrip(callTool("noisy"));
    EXPECT_NE(reply.Find("result"), nullptr);
}

TEST(ProcessBackend, ExitedChildFailsWithProcessIoError) {
    ProcessBackend backend(shell("exit 3"));
    backend.Start();
    for (int i = 0; i < 100 && backend.IsRunning(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(failureKind(backend), errors::ErrorKind::ProcessIoError);
}

TEST(ProcessBackend, ClosedOutputFailsWithProcessIoError) {
    ProcessBackend backend(shell("read line; exit 0"));
    EXPECT_EQ(failureKind(backend), errors::ErrorKind::ProcessIoError);
}

TEST(ProcessBackend, GarbageReplyIsJsonParseError) {
    ProcessBackend backend(shell("while read line; do echo 'not json'; done"));
    EXPECT_EQ(failureKind(backend), errors::ErrorKind::JsonParseError);
}

TEST(ProcessBackend, MissingCommandFailsToStart) {
    ProcessBackend::Options opts;
    opts.command = "mcpproxy-definitely-not-a-real-command";
    ProcessBackend backend(opts);
    try {
        backend.Start();
        FAIL() << "expected spawn failure";
    } catch (const errors::BackendError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ProcessIoError);
    }
}

TEST(ProcessBackend, StubbornChildIsTerminatedAfterGrace) {
    ProcessBackend::Options opts = shell("exec sleep 30");
    opts.shutdownGrace = std::chrono::milliseconds(100);
    ProcessBackend backend(opts);
    backend.Start();

    const auto start = std::chrono::steady_clock::now();
    backend.Close();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_FALSE(backend.IsRunning());
    EXPECT_THROW((void)backend.RoundTrip(callTool("after")), errors::BackendError);
}

TEST(ProcessBackend, DescribeListsCommandLine) {
    ProcessBackend::Options opts;
    opts.command = "python3";
    opts.args = {"server.py", "--port", "9"};
    EXPECT_EQ(ProcessBackend(opts).Describe(), "process python3 server.py --port 9");
}
