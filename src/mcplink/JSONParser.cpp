//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer, deep copy, and JSON-RPC message codecs
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <format>
#include <sstream>
#include <iomanip>

#include "mcplink/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcplink {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() = default;

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

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0u};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const { throw JSONParseError(what, i); }

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
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
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
                        // High surrogate must be followed by \uDC00-\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const std::string num = s.substr(start, i - start);
        errno = 0;
        if (!isFloat) {
            long long v = std::strtoll(num.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: keep magnitude as double
            errno = 0;
        }
        double d = std::strtod(num.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d)) fail("Number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' or ']' in array");
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
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' or '}' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > MaxDepth) fail("Nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Unexpected trailing characters");
        return v;
    }
};

void appendQuoted(std::ostringstream& oss, const std::string& v) {
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

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendQuoted(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { serializeInto(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                appendQuoted(oss, key);
                oss << ':';
                if (val) { serializeInto(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

JSONRPCId idFromValue(const JSONValue* v) {
    if (v == nullptr) {
        return nullptr;
    }
    if (std::holds_alternative<std::string>(v->value)) {
        return std::get<std::string>(v->value);
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    return nullptr;
}

void appendId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendQuoted(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

std::optional<JSONValue> optionalMember(const JSONValue& root, const char* key) {
    const JSONValue* m = FindMember(root, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    return *m;
}
} // namespace

///////////////////////////////////////// JSON helpers ///////////////////////////////////////////
JSONValue ParseJSON(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    return p.parseDocument();
}

std::optional<JSONValue> TryParseJSON(const std::string& json) {
    try {
        return ParseJSON(json);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("TryParseJSON: {}", e.what());
        return std::nullopt;
    }
}

std::string serializeJSONValue(const JSONValue& value) {
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

JSONValue DeepCopyJSON(const JSONValue& value) {
    if (std::holds_alternative<JSONValue::Array>(value.value)) {
        JSONValue::Array out;
        const auto& arr = std::get<JSONValue::Array>(value.value);
        out.reserve(arr.size());
        for (const auto& item : arr) {
            out.push_back(std::make_shared<JSONValue>(item ? DeepCopyJSON(*item) : JSONValue(nullptr)));
        }
        return JSONValue(std::move(out));
    }
    if (std::holds_alternative<JSONValue::Object>(value.value)) {
        JSONValue::Object out;
        for (const auto& [k, v] : std::get<JSONValue::Object>(value.value)) {
            out[k] = std::make_shared<JSONValue>(v ? DeepCopyJSON(*v) : JSONValue(nullptr));
        }
        return JSONValue(std::move(out));
    }
    // Scalars hold no shared state
    return value;
}

bool JSONEquals(const JSONValue& a, const JSONValue& b) {
    if (a.isNumber() && b.isNumber()) {
        auto asDouble = [](const JSONValue& v) {
            return std::holds_alternative<int64_t>(v.value) ? static_cast<double>(std::get<int64_t>(v.value))
                                                            : std::get<double>(v.value);
        };
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t k = 0; k < x.size(); ++k) {
            const JSONValue nil;
            if (!JSONEquals(x[k] ? *x[k] : nil, y[k] ? *y[k] : nil)) return false;
        }
        return true;
    }
    if (a.isObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [k, v] : x) {
            auto it = y.find(k);
            if (it == y.end()) return false;
            const JSONValue nil;
            if (!JSONEquals(v ? *v : nil, it->second ? *it->second : nil)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const JSONValue* FindMember(const JSONValue& v, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(v.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (m == nullptr || !std::holds_alternative<std::string>(m->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(m->value)) {
        return std::get<int64_t>(m->value);
    }
    if (std::holds_alternative<double>(m->value)) {
        double d = std::get<double>(m->value);
        if (std::floor(d) == d) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

std::optional<bool> GetBoolMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (m == nullptr || !std::holds_alternative<bool>(m->value)) {
        return std::nullopt;
    }
    return std::get<bool>(m->value);
}

void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

std::string JSONRPCIdToString(const JSONRPCId& id) {
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { out = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { out = std::to_string(v); }
    }, id);
    return out;
}

///////////////////////////////////////// JSON-RPC messages ///////////////////////////////////////////
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    appendId(oss, id);
    oss << ",\"method\":";
    appendQuoted(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        const JSONValue root = ParseJSON(json);
        auto m = GetStringMember(root, "method");
        if (!m.has_value() || FindMember(root, "id") == nullptr) {
            return false;
        }
        method = *m;
        id = idFromValue(FindMember(root, "id"));
        params = optionalMember(root, "params");
        return !method.empty();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"id\":";
    appendId(oss, id);
    if (result.has_value()) {
        oss << ",\"result\":";
        serializeInto(oss, result.value());
    }
    if (error.has_value()) {
        oss << ",\"error\":";
        serializeInto(oss, error.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        const JSONValue root = ParseJSON(json);
        if (!root.isObject()) {
            return false;
        }
        id = idFromValue(FindMember(root, "id"));
        result = optionalMember(root, "result");
        error = optionalMember(root, "error");
        return result.has_value() || error.has_value();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\",\"method\":";
    appendQuoted(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        const JSONValue root = ParseJSON(json);
        auto m = GetStringMember(root, "method");
        if (!m.has_value()) {
            return false;
        }
        method = *m;
        params = optionalMember(root, "params");
        return !method.empty();
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    SetMember(errorObj, "code", JSONValue(static_cast<int64_t>(code)));
    SetMember(errorObj, "message", JSONValue(message));
    if (data.has_value()) {
        SetMember(errorObj, "data", data.value());
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

} // namespace mcplink
