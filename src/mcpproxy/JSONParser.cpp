//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive JSON parser/serializer and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <iomanip>
#include "mcpproxy/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcpproxy {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (!IsObject()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

JSONValue* JSONValue::Find(const std::string& key) {
    return const_cast<JSONValue*>(static_cast<const JSONValue&>(*this).Find(key));
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (lhs.size() != rhs.size()) return false;
            for (size_t i = 0; i < lhs.size(); ++i) {
                const bool ln = !lhs[i];
                const bool rn = !rhs[i];
                if (ln || rn) {
                    if (ln != rn) return false;
                    continue;
                }
                if (*lhs[i] != *rhs[i]) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [key, val] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end()) return false;
                if (!val || !it->second) {
                    if (static_cast<bool>(val) != static_cast<bool>(it->second)) return false;
                    continue;
                }
                if (*val != *it->second) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.value);
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    static constexpr int kMaxDepth = 512;

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(std::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10 + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10 + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (c == '\\') {
                if (i >= s.size()) fail("Invalid escape");
                char e = s[i++];
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned int code = parseHex4();
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            // High surrogate; combine with a following low surrogate when present
                            if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                                std::size_t save = i;
                                i += 2;
                                unsigned int low = parseHex4();
                                if (low >= 0xDC00 && low <= 0xDFFF) {
                                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                                } else {
                                    i = save;
                                    code = 0xFFFD;
                                }
                            } else {
                                code = 0xFFFD;
                            }
                        } else if (code >= 0xDC00 && code <= 0xDFFF) {
                            code = 0xFFFD;
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: fail("Unknown escape");
                }
            } else if (static_cast<unsigned char>(c) < 0x20) {
                fail("Control character in string");
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("Invalid value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Expected digits after '.'");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Expected exponent digits");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double
            }
        }
        // strtod yields the nearest value on underflow (0 or subnormal) and +-HUGE_VAL on overflow;
        // the grammar above already guarantees the whole token is consumed
        return JSONValue(std::strtod(num.c_str(), nullptr));
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue v = parseValueInner();
        --depth;
        return v;
    }

    JSONValue parseValueInner() {
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            fail("Invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            fail("Invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            fail("Invalid literal");
        }
        return parseNumber();
    }
};

void writeEscapedString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
            } else if (v == std::floor(v) && std::fabs(v) < 1e15) {
                // Keep a fraction marker so the value reads back as a double
                oss << std::format("{:.1f}", v);
            } else {
                oss << std::format("{}", v);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscapedString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) {
                    writeValue(oss, *v[i]);
                } else {
                    oss << "null";
                }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscapedString(oss, key);
                oss << ':';
                if (val) {
                    writeValue(oss, *val);
                } else {
                    oss << "null";
                }
            }
            oss << '}';
        }
    }, value.get());
}

// Reads an "id" member: absent -> nullopt result with ok=true; int/string/null accepted; other types reject.
bool readId(const JSONValue& root, std::optional<JSONRPCId>& out) {
    out.reset();
    const JSONValue* idVal = root.Find("id");
    if (!idVal) {
        return true;
    }
    if (std::holds_alternative<int64_t>(idVal->value)) {
        out = std::get<int64_t>(idVal->value);
        return true;
    }
    if (std::holds_alternative<std::string>(idVal->value)) {
        out = std::get<std::string>(idVal->value);
        return true;
    }
    if (std::holds_alternative<std::nullptr_t>(idVal->value)) {
        out = nullptr;
        return true;
    }
    return false;
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

std::string JSONRPCIdToString(const JSONRPCId& id) {
    std::ostringstream oss;
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeEscapedString(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
    return oss.str();
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscapedString(oss, jsonrpc);
    if (id.has_value()) {
        oss << ",\"id\":" << JSONRPCIdToString(*id);
    }
    oss << ",\"method\":";
    writeEscapedString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue root = ParseJSON(json);
        if (!root.IsObject()) {
            LOG_DEBUG("JSONRPCRequest: top-level value is not an object");
            return false;
        }
        const JSONValue* ver = root.Find("jsonrpc");
        if (!ver || !ver->IsString()) {
            LOG_DEBUG("JSONRPCRequest: missing or non-string 'jsonrpc'");
            return false;
        }
        const JSONValue* m = root.Find("method");
        if (!m || !m->IsString()) {
            LOG_DEBUG("JSONRPCRequest: missing or non-string 'method'");
            return false;
        }
        std::optional<JSONRPCId> parsedId;
        if (!readId(root, parsedId)) {
            LOG_DEBUG("JSONRPCRequest: 'id' must be an integer, string or null");
            return false;
        }
        jsonrpc = std::get<std::string>(ver->value);
        method = std::get<std::string>(m->value);
        id = std::move(parsedId);
        params.reset();
        if (const JSONValue* p = root.Find("params")) {
            params = *p;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscapedString(oss, jsonrpc);
    oss << ",\"id\":" << JSONRPCIdToString(id);

    if (result.has_value()) {
        oss << ",\"result\":";
        writeValue(oss, result.value());
    }

    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    }

    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue root = ParseJSON(json);
        if (!root.IsObject()) {
            return false;
        }
        std::optional<JSONRPCId> parsedId;
        if (!readId(root, parsedId)) {
            return false;
        }
        id = parsedId.value_or(JSONRPCId{nullptr});
        result.reset();
        error.reset();
        if (const JSONValue* r = root.Find("result")) {
            result = *r;
        }
        if (const JSONValue* e = root.Find("error")) {
            error = *e;
        }
        return result.has_value() || error.has_value();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpproxy
