//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseNormalizer.cpp
// Purpose: SSE/plain JSON detection, payload extraction and content text repair
//==========================================================================================================

#include <array>
#include <format>
#include <utility>

#include "mcpproxy/ResponseNormalizer.h"
#include "mcpproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpproxy {

namespace {

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

bool IsSseBody(const std::string& body) {
    return body.rfind("event:", 0) == 0 || body.find("data:") != std::string::npos;
}

std::optional<std::string> ExtractSseData(const std::string& body) {
    static const std::string kPrefix = "data: ";
    std::size_t start = 0;
    while (start <= body.size()) {
        std::size_t nl = body.find('\n', start);
        std::size_t end = (nl == std::string::npos) ? body.size() : nl;
        std::string line = body.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind(kPrefix, 0) == 0) {
            std::string payload = line.substr(kPrefix.size());
            if (payload.empty()) {
                return std::nullopt;
            }
            return payload;
        }
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    return std::nullopt;
}

std::string RepairDoubleEscapes(std::string text) {
    static const std::array<std::pair<const char*, const char*>, 6> kSubstitutions{{
        {"\\u0027", "'"},
        {"\\u0060", "`"},
        {"\\u0022", "\""},
        {"\\u003C", "<"},
        {"\\u003E", ">"},
        {"\\n", "\n"},
    }};
    for (const auto& [from, to] : kSubstitutions) {
        replaceAll(text, from, to);
    }
    return text;
}

void RepairContentText(JSONValue& reply) {
    JSONValue* result = reply.Find("result");
    if (!result) {
        return;
    }
    JSONValue* content = result->Find("content");
    if (!content || !content->IsArray()) {
        return;
    }
    for (auto& item : std::get<JSONValue::Array>(content->value)) {
        if (!item) {
            continue;
        }
        JSONValue* text = item->Find("text");
        if (text && text->IsString()) {
            auto& s = std::get<std::string>(text->value);
            s = RepairDoubleEscapes(std::move(s));
        }
    }
}

JSONValue NormalizeHttpBody(int status, const std::string& body) {
    FUNC_SCOPE();
    if (isBlank(body)) {
        throw errors::BackendError(errors::ErrorKind::EmptyBody, "Empty response body from MCP server");
    }

    JSONValue reply;
    if (IsSseBody(body)) {
        auto data = ExtractSseData(body);
        if (!data.has_value()) {
            throw errors::BackendError(errors::ErrorKind::NoSseData, "No data found in SSE response");
        }
        try {
            reply = ParseJSON(*data);
        } catch (const std::exception& e) {
            throw errors::BackendError(errors::ErrorKind::JsonParseError,
                std::format("Failed to parse SSE JSON data. Status: {}, Data: {} ({})", status, *data, e.what()));
        }
        LOG_DEBUG("Backend reply was SSE framed ({} bytes)", body.size());
    } else {
        try {
            reply = ParseJSON(body);
        } catch (const std::exception& e) {
            throw errors::BackendError(errors::ErrorKind::JsonParseError,
                std::format("Failed to parse JSON response. Status: {}, Body: {} ({})", status, body, e.what()));
        }
    }

    RepairContentText(reply);
    return reply;
}

JSONValue ParseBackendLine(const std::string& line) {
    FUNC_SCOPE();
    if (isBlank(line)) {
        throw errors::BackendError(errors::ErrorKind::EmptyBody, "Empty response line from MCP server");
    }
    try {
        return ParseJSON(line);
    } catch (const std::exception& e) {
        throw errors::BackendError(errors::ErrorKind::JsonParseError,
            std::format("Failed to parse JSON response line: {} ({})", line, e.what()));
    }
}

} // namespace mcpproxy
