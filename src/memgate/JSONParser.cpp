//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer, and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cmath>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include "memgate/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace memgate {

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

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int kMaxDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what + " at offset " + std::to_string(i));
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
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
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
        ++i; // skip opening quote
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
                        // High surrogate must be followed by \uDC00..\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
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
        auto digits = [this]() {
            std::size_t n = 0;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++n; }
            return n;
        };
        if (i < s.size() && s[i] == '-') ++i;
        if (i < s.size() && s[i] == '0') {
            ++i;
        } else if (digits() == 0) {
            fail("Invalid value");
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (digits() == 0) fail("Expected digits after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (digits() == 0) fail("Expected exponent digits");
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(num.c_str(), &end, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: keep the magnitude as a double
        }
        std::istringstream iss(num);
        iss.imbue(std::locale::classic());
        double d = 0.0;
        iss >> d;
        if (iss.fail()) fail("Invalid number");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                JSONValue val = parseValue();
                arr.push_back(std::make_shared<JSONValue>(std::move(val)));
                if (match(']')) break;
                if (!match(',')) fail("Expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("Expected ':' after key");
                JSONValue val = parseValue();
                obj[key] = std::make_shared<JSONValue>(std::move(val));
                if (match('}')) break;
                if (!match(',')) fail("Expected ',' in object");
            }
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
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
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
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
                return;
            }
            std::ostringstream num;
            num.imbue(std::locale::classic());
            num << std::setprecision(17) << v;
            std::string text = num.str();
            if (text.find_first_of(".eE") == std::string::npos) {
                text += ".0";
            }
            oss << text;
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscapedString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) writeValue(oss, *v[i]); else oss << "null";
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
                if (val) writeValue(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    oss << ",\"id\":";
    writeValue(oss, IdToJSON(id));
}

// Returns the "id" member as a JSONRPCId; absent id reads as null.
bool readId(const JSONValue& value, JSONRPCId& out) {
    const JSONValue* idVal = FindMember(value, "id");
    if (!idVal) {
        out = nullptr;
        return true;
    }
    auto id = IdFromJSON(*idVal);
    if (!id.has_value()) {
        return false;
    }
    out = std::move(*id);
    return true;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    if (!object.IsObject()) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<std::string>(v->value)) {
        return std::get<std::string>(v->value);
    }
    return std::nullopt;
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    return std::nullopt;
}

std::optional<bool> GetBoolMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<bool>(v->value)) {
        return std::get<bool>(v->value);
    }
    return std::nullopt;
}

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

std::optional<JSONRPCId> IdFromJSON(const JSONValue& value) {
    if (std::holds_alternative<std::string>(value.value)) {
        return JSONRPCId{std::get<std::string>(value.value)};
    }
    if (std::holds_alternative<int64_t>(value.value)) {
        return JSONRPCId{std::get<int64_t>(value.value)};
    }
    if (value.IsNull()) {
        return JSONRPCId{nullptr};
    }
    return std::nullopt;
}

std::string IdToString(const JSONRPCId& id) {
    return SerializeJSON(IdToJSON(id));
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    writeId(oss, id);
    oss << ",\"method\":";
    writeEscapedString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::FromValue(const JSONValue& value) {
    auto m = GetStringMember(value, "method");
    if (!m.has_value() || !readId(value, id)) {
        return false;
    }
    method = std::move(*m);
    const JSONValue* p = FindMember(value, "params");
    if (p) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    writeId(oss, id);
    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    } else {
        // A success response always carries a result member, null when unset
        oss << ",\"result\":";
        if (result.has_value()) writeValue(oss, result.value()); else oss << "null";
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::FromValue(const JSONValue& value) {
    const JSONValue* r = FindMember(value, "result");
    const JSONValue* e = FindMember(value, "error");
    if ((!r && !e) || !readId(value, id)) {
        return false;
    }
    if (r) result = *r; else result.reset();
    if (e) error = *e; else error.reset();
    return true;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"method\":";
    writeEscapedString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::FromValue(const JSONValue& value) {
    auto m = GetStringMember(value, "method");
    if (!m.has_value()) {
        return false;
    }
    method = std::move(*m);
    const JSONValue* p = FindMember(value, "params");
    if (p) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
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
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace memgate
