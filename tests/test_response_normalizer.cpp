//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_response_normalizer.cpp
// Purpose: Plain JSON vs SSE-framed bodies, escape repair of tool text, and body failure kinds
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpproxy/ResponseNormalizer.h"
#include "mcpproxy/errors/Errors.h"

using namespace mcpproxy;

namespace {

errors::ErrorKind kindOf(int status, const std::string& body) {
    try {
        (void)NormalizeHttpBody(status, body);
    } catch (const errors::BackendError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected BackendError for body: " << body;
    return errors::ErrorKind::HttpFailure;
}

std::string textOf(const JSONValue& reply, std::size_t index) {
    const JSONValue* content = reply.Find("result")->Find("content");
    const auto& arr = std::get<JSONValue::Array>(content->value);
    return std::get<std::string>(arr.at(index)->Find("text")->value);
}

} // namespace

TEST(ResponseNormalizer, DetectsSseBodies) {
    EXPECT_TRUE(IsSseBody("event: message\ndata: {}\n\n"));
    EXPECT_TRUE(IsSseBody("id: 1\ndata: {}\n"));
    EXPECT_FALSE(IsSseBody(R"({"result":{}})"));
}

TEST(ResponseNormalizer, ExtractsFirstDataLine) {
    auto data = ExtractSseData("event: message\r\ndata: {\"a\":1}\r\n\r\ndata: {\"a\":2}\r\n");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, "{\"a\":1}");
    EXPECT_FALSE(ExtractSseData("event: message\n\n").has_value());
    EXPECT_FALSE(ExtractSseData("event: message\ndata: \n").has_value());
}

TEST(ResponseNormalizer, PlainAndSseBodiesNormalizeIdentically) {
    const std::string payload = R"({"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"echo"}]}})";
    JSONValue plain = NormalizeHttpBody(200, payload);
    JSONValue sse = NormalizeHttpBody(200, "event: message\ndata: " + payload + "\n\n");
    EXPECT_EQ(plain, sse);
    EXPECT_EQ(plain, ParseJSON(payload));
}

TEST(ResponseNormalizer, RepairsEscapesInContentTextOnly) {
    const std::string body =
        R"({"result":{"content":[{"type":"text","text":"It\\u0027s \\u0022ok\\u0022"},)"
        R"({"type":"text","text":"a\\nb \\u003Ctag\\u003E \\u0060x\\u0060"},{"type":"image","data":"AAA"}],)"
        R"("meta":"It\\u0027s"}})";
    JSONValue reply = NormalizeHttpBody(200, body);
    EXPECT_EQ(textOf(reply, 0), "It's \"ok\"");
    EXPECT_EQ(textOf(reply, 1), "a\nb <tag> `x`");
    EXPECT_EQ(std::get<std::string>(reply.Find("result")->Find("meta")->value), "It\\u0027s");
}

TEST(ResponseNormalizer, RepairIsIdentityWithoutEscapes) {
    EXPECT_EQ(RepairDoubleEscapes("plain text 'already' fine"), "plain text 'already' fine");
    JSONValue v = ParseJSON(R"({"result":{"content":"not an array"}})");
    JSONValue copy = v;
    RepairContentText(v);
    EXPECT_EQ(v, copy);
}

TEST(ResponseNormalizer, NonSuccessStatusStillParses) {
    JSONValue reply = NormalizeHttpBody(500, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"x"}})");
    ASSERT_NE(reply.Find("error"), nullptr);
}

TEST(ResponseNormalizer, FailureKinds) {
    EXPECT_EQ(kindOf(200, ""), errors::ErrorKind::EmptyBody);
    EXPECT_EQ(kindOf(200, "  \r\n"), errors::ErrorKind::EmptyBody);
    EXPECT_EQ(kindOf(200, "event: message\n\n"), errors::ErrorKind::NoSseData);
    EXPECT_EQ(kindOf(200, "data: {oops\n\n"), errors::ErrorKind::JsonParseError);
    EXPECT_EQ(kindOf(502, "<html>Bad Gateway</html>"), errors::ErrorKind::JsonParseError);
}

TEST(ResponseNormalizer, ParseErrorMessageNamesStatusAndBody) {
    try {
        (void)NormalizeHttpBody(502, "<html>Bad Gateway</html>");
        FAIL() << "expected BackendError";
    } catch (const errors::BackendError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Failed to parse JSON response. Status: 502"), std::string::npos);
        EXPECT_NE(msg.find("<html>Bad Gateway</html>"), std::string::npos);
    }
}

TEST(ResponseNormalizer, BackendLineIsParsedWithoutRepair) {
    JSONValue reply = ParseBackendLine(R"({"result":{"content":[{"text":"It\\u0027s"}]}})");
    EXPECT_EQ(textOf(reply, 0), "It\\u0027s");
    EXPECT_THROW(ParseBackendLine(""), errors::BackendError);
    EXPECT_THROW(ParseBackendLine("{not json"), errors::BackendError);
}
