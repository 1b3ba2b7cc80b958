//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON values and JSON-RPC 2.0 envelopes exchanged by the proxy on both of its sides
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcpproxy {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }

    //==========================================================================================================
    // Find
    // Purpose: Object member lookup.
    // Returns:
    //   Pointer to the member value, or nullptr when this is not an object or the key is absent.
    //==========================================================================================================
    const JSONValue* Find(const std::string& key) const;
    JSONValue* Find(const std::string& key);
};

// Deep structural equality (object member order is irrelevant).
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   text: JSON text. Leading/trailing whitespace is allowed; anything else after the value is not.
// Returns:
//   The parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value (no insignificant whitespace).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Renders an id the way it appears on the wire ("7", "\"abc\"", "null").
std::string JSONRPCIdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns canonical JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request or notification as read from the proxy's input stream.
// Fields:
//   id: Request id; std::nullopt when the member is absent. An absent or null id marks a notification.
//   method: Method name.
//   params: Optional params value, carried verbatim.
// Methods:
//   Deserialize(json): Returns false when the text is not a JSON object with string "jsonrpc" and
//                      "method" members and an id that is absent, null, an integer or a string.
//   IsNotification(): True when no response may be sent.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    std::optional<JSONRPCId> id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsNotification() const {
        return !id.has_value() || std::holds_alternative<std::nullptr_t>(*id);
    }
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
// Methods:
//   Serialize(): Members in the order jsonrpc, id, result|error.
//   Deserialize(json)
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() : id(nullptr) {}
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
// Args:
//   id: Request id to echo in the response (string | int64 | null).
//   code: Integer error code.
//   message: Error message.
//   data: Optional structured payload.
// Returns:
//   unique_ptr<JSONRPCResponse> with error populated.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpproxy
