//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types for the memgate gateway
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace memgate {

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

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON when the input is not well-formed JSON.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    explicit JSONParseError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document (RFC 8259). Whitespace may surround the value; anything else
//          after it is an error. Nesting deeper than 256 levels is rejected.
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   JSONValue for the document.
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON serialization of a value. Non-finite doubles are written as null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//////////////////////////////////////// Object accessors ///////////////////////////////////////////////
// Member lookup helpers; all return empty/null when the value is not an object or the member has another type.
const JSONValue* FindMember(const JSONValue& object, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& object, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null. Opaque to the protocol layer.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Converts an id to its JSON value and back. IdFromJSON returns nullopt for ids that are not
// string/integer/null (floats, objects, arrays).
JSONValue IdToJSON(const JSONRPCId& id);
std::optional<JSONRPCId> IdFromJSON(const JSONValue& value);
// Human-readable rendering for logs ("42", "\"abc\"", "null").
std::string IdToString(const JSONRPCId& id);
inline bool IsNullId(const JSONRPCId& id) { return std::holds_alternative<std::nullptr_t>(id); }

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns canonical JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//   FromValue(value): Populates from an already-parsed object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
    virtual bool FromValue(const JSONValue& value) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
// Ctors:
//   JSONRPCRequest(id, method, params?): Initializes fields (params optional).
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    bool FromValue(const JSONValue& value) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
// Methods:
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    bool FromValue(const JSONValue& value) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
// Ctors:
//   JSONRPCNotification(method, params?): Initializes method and optional params.
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    bool FromValue(const JSONValue& value) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the gateway's session/auth/resource codes.
// Notes:
//   Values are fixed; gateway codes live in the implementation-defined -320xx range.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Gateway specific error codes
    constexpr int SessionNotFound = -32000;
    constexpr int Unauthorized = -32001;
    constexpr int ResourceNotFound = -32002;
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

} // namespace memgate
