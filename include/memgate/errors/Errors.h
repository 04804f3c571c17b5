//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, the handler exception type, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "memgate/JSONRPCTypes.h"

namespace memgate {
namespace errors {

// Categorization of the gateway's JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    SessionNotFound,
    Unauthorized,
    ResourceNotFound,
    Unknown
};

// Typed error representation carried between handlers, router and transports.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or gateway-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::SessionNotFound: return ErrorCategory::SessionNotFound;
        case JSONRPCErrorCodes::Unauthorized: return ErrorCategory::Unauthorized;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeError(static_cast<int>(*code), std::move(*message), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
//
// Args:
//   response: JSONRPCResponse that may contain an error object.
//
// Returns:
//   std::optional<McpError> when response.IsError() and shape is valid.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Thrown by method handlers and the tool executor to report a typed JSON-RPC error. The method
//          router converts it into an error response that echoes the request id.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), error_(makeError(code, message, std::move(data))) {}

    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }

private:
    McpError error_;
};

// Shorthands for the errors handlers raise most often.
inline McpException invalidParams(const std::string& message, std::optional<JSONValue> data = std::nullopt) {
    return McpException(JSONRPCErrorCodes::InvalidParams, message, std::move(data));
}

inline McpException internalError(const std::string& message, std::optional<JSONValue> data = std::nullopt) {
    return McpException(JSONRPCErrorCodes::InternalError, message, std::move(data));
}

} // namespace errors
} // namespace memgate
