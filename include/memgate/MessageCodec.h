//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Decodes raw JSON-RPC 2.0 payloads into typed messages and classifies malformed input
//==========================================================================================================
#pragma once

#include <string>
#include <variant>
#include <vector>

#include "memgate/JSONRPCTypes.h"

namespace memgate {

//==========================================================================================================
// MessageKind
// Purpose: Classification of a JSON-RPC message by the members it carries.
//==========================================================================================================
enum class MessageKind { Request, Response, Notification };

// Decoded message: exactly one of request, response, or notification.
using Message = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

//==========================================================================================================
// DecodeError
// Purpose: Why a payload could not be decoded. code is ParseError or InvalidRequest. id holds the request id
//          when the payload was an object with a usable id, so the transport can still answer it.
//==========================================================================================================
struct DecodeError {
    int code{JSONRPCErrorCodes::ParseError};
    std::string message;
    JSONRPCId id{nullptr};
    bool hasId{false};
};

using DecodeResult = std::variant<Message, DecodeError>;

//==========================================================================================================
// DecodedBatch
// Purpose: Entries of a payload in submitted order. isArray is false when the payload was a single message.
//==========================================================================================================
struct DecodedBatch {
    bool isArray{false};
    std::vector<DecodeResult> entries;
};

//==========================================================================================================
// DecodeMessage
// Purpose: Decode one JSON-RPC message.
// Args:
//   bytes: Raw payload text.
// Returns:
//   Message on success; DecodeError(ParseError) for malformed JSON; DecodeError(InvalidRequest) when the value
//   is not an object, method is missing or not a string, the id has an illegal type, or jsonrpc is not "2.0".
//==========================================================================================================
DecodeResult DecodeMessage(const std::string& bytes);

// Same classification applied to an already-parsed value.
DecodeResult DecodeMessageValue(const JSONValue& value);

//==========================================================================================================
// DecodeBatch
// Purpose: Decode a payload that may be a JSON-RPC batch. Each array element is decoded independently.
// Returns:
//   DecodedBatch, or DecodeError for malformed JSON (ParseError) and empty arrays (InvalidRequest).
//==========================================================================================================
std::variant<DecodedBatch, DecodeError> DecodeBatch(const std::string& bytes);

// Serialize a message. Never fails for well-formed values.
std::string EncodeMessage(const Message& message);

MessageKind KindOf(const Message& message);

// Error response answering a decode failure (id echoed when recovered, null otherwise).
std::unique_ptr<JSONRPCResponse> MakeDecodeErrorResponse(const DecodeError& error);

} // namespace memgate
