//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxySession.cpp
// Purpose: Session loop and method routing for mcp-proxy
//==========================================================================================================

#include <istream>
#include <ostream>

#include "mcpproxy/ProxySession.h"
#include "mcpproxy/Envelope.h"
#include "mcpproxy/errors/Errors.h"
#include "mcpproxy/version.h"
#include "logging/Logger.h"

namespace mcpproxy {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) {
        return std::string();
    }
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::shared_ptr<JSONValue> makeObject(JSONValue::Object obj) {
    return std::make_shared<JSONValue>(std::move(obj));
}

} // namespace

ProxySession::ProxySession(Backend& backend, std::istream& in, std::ostream& out)
    : backend_(backend), in_(in), out_(out) {}

JSONValue ProxySession::InitializeResult() {
    JSONValue::Object tools;
    tools["listChanged"] = std::make_shared<JSONValue>(true);

    JSONValue::Object capabilities;
    capabilities["tools"] = makeObject(std::move(tools));
    capabilities["logging"] = makeObject(JSONValue::Object{});

    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(kServerName);
    serverInfo["version"] = std::make_shared<JSONValue>(getVersionString());

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(kProtocolVersion);
    result["capabilities"] = makeObject(std::move(capabilities));
    result["serverInfo"] = makeObject(std::move(serverInfo));
    return JSONValue(std::move(result));
}

std::unique_ptr<JSONRPCResponse> ProxySession::forward(const JSONRPCRequest& request) {
    const JSONRPCId& id = *request.id;
    LOG_INFO("Proxying {} request to {}", request.method, DescribeBackend(backend_));
    try {
        JSONValue reply = RoundTrip(backend_, MakeToolRequest(request));
        return MakeProxyResponse(id, reply);
    } catch (const errors::BackendError& e) {
        LOG_ERROR("{} request failed [{}]: {}", request.method, errors::errorKindName(e.kind()), e.what());
        return MakeInternalErrorResponse(id, e);
    } catch (const std::exception& e) {
        LOG_ERROR("{} request failed: {}", request.method, e.what());
        return MakeInternalErrorResponse(id, e);
    }
}

std::unique_ptr<JSONRPCResponse> ProxySession::Dispatch(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    if (request.method == Methods::Initialized) {
        LOG_INFO("Received initialized notification");
        return nullptr;
    }
    if (request.IsNotification()) {
        LOG_DEBUG("Ignoring notification {}", request.method);
        return nullptr;
    }

    const JSONRPCId& id = *request.id;
    if (request.method == Methods::Initialize) {
        LOG_INFO("Handling initialize request");
        return std::make_unique<JSONRPCResponse>(id, InitializeResult());
    }
    if (request.method == Methods::ListTools || request.method == Methods::CallTool) {
        return forward(request);
    }

    LOG_WARN("Unknown method: {}", request.method);
    return MakeMethodNotFoundResponse(id, request.method);
}

std::optional<std::string> ProxySession::HandleLine(const std::string& line) {
    const std::string text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }
    state_ = SessionState::Dispatch;
    LOG_DEBUG("Received request: {}", text);

    JSONRPCRequest request;
    if (!request.Deserialize(text)) {
        LOG_WARN("Failed to parse JSON-RPC request, line skipped: {}", text);
        state_ = SessionState::Skip;
        return std::nullopt;
    }

    auto response = Dispatch(request);
    if (!response) {
        state_ = SessionState::Skip;
        return std::nullopt;
    }
    state_ = SessionState::Respond;
    return response->Serialize();
}

std::size_t ProxySession::Run() {
    FUNC_SCOPE();
    std::size_t written = 0;
    std::string line;
    state_ = SessionState::AwaitingLine;
    while (std::getline(in_, line)) {
        std::optional<std::string> response = HandleLine(line);
        if (response.has_value()) {
            out_ << *response << '\n';
            out_.flush();
            if (!out_) {
                LOG_ERROR("Output stream failed; ending session");
                break;
            }
            ++written;
        }
        state_ = SessionState::AwaitingLine;
    }
    state_ = SessionState::Finished;
    LOG_DEBUG("Session finished after {} responses", written);
    return written;
}

} // namespace mcpproxy
