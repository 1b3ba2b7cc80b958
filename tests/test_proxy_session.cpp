//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_proxy_session.cpp
// Purpose: End-to-end dispatcher behavior over string streams (initialize, routing, errors, ordering)
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcpproxy/Backend.h"
#include "mcpproxy/ProxySession.h"

using namespace mcpproxy;

namespace {

// Answers every line with an empty tools list; tools/call requests naming "slow" are delayed first.
const char* kToolServer =
    "while IFS= read -r line; do "
    "case \"$line\" in *slow*) sleep 0.3;; esac; "
    "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"tools\":[]}}'; "
    "done";

Backend processBackend(const std::string& script) {
    ProcessBackend::Options opts;
    opts.command = "/bin/sh";
    opts.args = {"-c", script};
    return Backend(std::in_place_type<ProcessBackend>, opts);
}

// A backend that must never be reached: any forwarded call fails.
Backend unreachableBackend() {
    return Backend(std::in_place_type<SocketBackend>, SocketBackend::Options{"/nonexistent/mcpproxy-test.sock"});
}

// One-shot HTTP peer that answers a single POST with an SSE-framed body.
struct SseServer {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    unsigned short port{0};

    explicit SseServer(std::string payload) {
        namespace http = boost::beast::http;
        using tcp = boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        thr = std::thread([this, payload = std::move(payload)]() {
            boost::system::error_code ec;
            tcp::socket socket{io};
            acceptor.accept(socket, ec);
            if (ec) {
                return;
            }
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec) {
                return;
            }
            http::response<http::string_body> res{http::status::ok, req.version()};
            res.set(http::field::content_type, "text/event-stream");
            res.keep_alive(false);
            res.body() = "event: message\ndata: " + payload + "\n\n";
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        });
    }

    ~SseServer() {
        if (thr.joinable()) {
            thr.join();
        }
    }
};

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        out.push_back(line);
    }
    return out;
}

std::vector<std::string> runSession(Backend& backend, const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    ProxySession session(backend, in, out);
    std::size_t written = session.Run();
    EXPECT_EQ(session.State(), SessionState::Finished);
    auto result = lines(out.str());
    EXPECT_EQ(result.size(), written);
    return result;
}

} // namespace

TEST(ProxySession, InitializeIsAnsweredLocally) {
    Backend backend = unreachableBackend();
    auto out = runSession(backend, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})" "\n");
    ASSERT_EQ(out.size(), 1u);

    JSONValue resp = ParseJSON(out[0]);
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 1);
    const JSONValue* result = resp.Find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(std::get<std::string>(result->Find("protocolVersion")->value), "2024-11-05");
    EXPECT_TRUE(std::get<bool>(result->Find("capabilities")->Find("tools")->Find("listChanged")->value));
    EXPECT_TRUE(result->Find("capabilities")->Find("logging")->IsObject());
    EXPECT_EQ(std::get<std::string>(result->Find("serverInfo")->Find("name")->value), "mcp-proxy");
    EXPECT_EQ(std::get<std::string>(result->Find("serverInfo")->Find("version")->value), "1.0.0");
    EXPECT_EQ(*result, ProxySession::InitializeResult());
}

TEST(ProxySession, ToolsListEndToEnd) {
    Backend backend = processBackend(kToolServer);
    auto out = runSession(backend, R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{}})" "\n");
    CloseBackend(backend);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], R"({"jsonrpc":"2.0","id":7,"result":{"tools":[]}})");
}

TEST(ProxySession, ToolsListEndToEndOverHttp) {
    SseServer srv(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})");
    HTTPBackend::Options opts;
    opts.url = "http://127.0.0.1:" + std::to_string(srv.port) + "/mcp";
    opts.timeoutMs = 3000;
    Backend backend(std::in_place_type<HTTPBackend>, opts);
    StartBackend(backend);

    auto out = runSession(backend, R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{}})" "\n");
    CloseBackend(backend);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], R"({"jsonrpc":"2.0","id":7,"result":{"tools":[]}})");
}

TEST(ProxySession, RequestWithUnderflowingNumberIsAnswered) {
    Backend backend = processBackend(kToolServer);
    auto out = runSession(backend,
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"calc","arguments":{"x":1e-400}}})" "\n");
    CloseBackend(backend);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], R"({"jsonrpc":"2.0","id":9,"result":{"tools":[]}})");
}

TEST(ProxySession, NotificationsProduceNoOutput) {
    Backend backend = unreachableBackend();
    auto out = runSession(backend,
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":null,"method":"tools/call","params":{"name":"x"}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":1}})" "\n");
    EXPECT_TRUE(out.empty());
}

TEST(ProxySession, UnknownMethodIsMethodNotFound) {
    Backend backend = unreachableBackend();
    auto out = runSession(backend, R"({"jsonrpc":"2.0","id":"abc","method":"resources/list"})" "\n");
    ASSERT_EQ(out.size(), 1u);
    JSONValue resp = ParseJSON(out[0]);
    EXPECT_EQ(std::get<std::string>(resp.Find("id")->value), "abc");
    EXPECT_EQ(std::get<int64_t>(resp.Find("error")->Find("code")->value), -32601);
    EXPECT_EQ(std::get<std::string>(resp.Find("error")->Find("message")->value), "Method not found: resources/list");
}

TEST(ProxySession, MalformedAndBlankLinesAreSkipped) {
    Backend backend = unreachableBackend();
    auto out = runSession(backend,
        "\n"
        "   \r\n"
        "this is not json\n"
        "[1,2]\n"
        R"({"id":1,"method":"initialize"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"initialize"})" "\n");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(ParseJSON(out[0]).Find("id")->value), 2);
}

TEST(ProxySession, BackendFailureBecomesInternalErrorAndSessionContinues) {
    Backend backend = unreachableBackend();
    auto out = runSession(backend,
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"x"}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"initialize"})" "\n");
    ASSERT_EQ(out.size(), 2u);

    JSONValue first = ParseJSON(out[0]);
    EXPECT_EQ(std::get<int64_t>(first.Find("id")->value), 1);
    const JSONValue* err = first.Find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(std::get<int64_t>(err->Find("code")->value), -32603);
    EXPECT_EQ(std::get<std::string>(err->Find("message")->value).rfind("Internal error: ", 0), 0u);

    EXPECT_NE(ParseJSON(out[1]).Find("result"), nullptr);
}

TEST(ProxySession, ResponsesFollowInputOrderAcrossLatencies) {
    Backend backend = processBackend(kToolServer);
    auto out = runSession(backend,
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"slow"}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"initialize"})" "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"slow"}})" "\n"
        R"({"jsonrpc":"2.0","id":5,"method":"bogus"})" "\n");
    CloseBackend(backend);

    ASSERT_EQ(out.size(), 5u);
    for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(std::get<int64_t>(ParseJSON(out[i]).Find("id")->value), static_cast<int64_t>(i + 1));
    }
}

TEST(ProxySession, BackendErrorReplyIsRelayed) {
    Backend backend = processBackend(
        "while read line; do echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":-32602,\"message\":\"Unknown tool\"}}'; done");
    auto out = runSession(backend, R"({"jsonrpc":"2.0","id":11,"method":"tools/call","params":{"name":"nope"}})" "\n");
    CloseBackend(backend);
    ASSERT_EQ(out.size(), 1u);
    JSONValue resp = ParseJSON(out[0]);
    EXPECT_EQ(std::get<int64_t>(resp.Find("id")->value), 11);
    EXPECT_EQ(std::get<int64_t>(resp.Find("error")->Find("code")->value), -32602);
    EXPECT_EQ(resp.Find("result"), nullptr);
}

TEST(ProxySession, HandleLineReportsState) {
    Backend backend = unreachableBackend();
    std::istringstream in;
    std::ostringstream out;
    ProxySession session(backend, in, out);
    EXPECT_EQ(session.State(), SessionState::Idle);

    EXPECT_FALSE(session.HandleLine("garbage").has_value());
    EXPECT_EQ(session.State(), SessionState::Skip);

    auto resp = session.HandleLine(R"(  {"jsonrpc":"2.0","id":1,"method":"initialize"}  )");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(session.State(), SessionState::Respond);
    EXPECT_TRUE(out.str().empty());
}
