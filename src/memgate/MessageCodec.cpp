//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: JSON-RPC 2.0 message classification and batch decoding
//==========================================================================================================

#include "memgate/MessageCodec.h"
#include "logging/Logger.h"

namespace memgate {

namespace {

DecodeError invalidRequest(const std::string& message, const JSONValue& value) {
    DecodeError err;
    err.code = JSONRPCErrorCodes::InvalidRequest;
    err.message = message;
    if (const JSONValue* idVal = FindMember(value, "id")) {
        auto id = IdFromJSON(*idVal);
        if (id.has_value()) {
            err.id = std::move(*id);
            err.hasId = !IsNullId(err.id);
        }
    }
    return err;
}

} // namespace

DecodeResult DecodeMessageValue(const JSONValue& value) {
    if (!value.IsObject()) {
        return invalidRequest("Invalid Request: expected a JSON object", value);
    }
    if (const JSONValue* version = FindMember(value, "jsonrpc")) {
        if (!version->IsString() || std::get<std::string>(version->value) != "2.0") {
            return invalidRequest("Invalid Request: jsonrpc must be \"2.0\"", value);
        }
    }
    const JSONValue* idVal = FindMember(value, "id");
    if (idVal && !IdFromJSON(*idVal).has_value()) {
        return invalidRequest("Invalid Request: id must be a string, integer, or null", value);
    }

    const JSONValue* methodVal = FindMember(value, "method");
    if (methodVal) {
        if (!methodVal->IsString()) {
            return invalidRequest("Invalid Request: method must be a string", value);
        }
        const JSONValue* params = FindMember(value, "params");
        if (params && !params->IsObject() && !params->IsArray()) {
            return invalidRequest("Invalid Request: params must be an object or array", value);
        }
        if (idVal) {
            JSONRPCRequest req;
            req.FromValue(value);
            return Message{std::move(req)};
        }
        JSONRPCNotification note;
        note.FromValue(value);
        return Message{std::move(note)};
    }

    if (FindMember(value, "result") || FindMember(value, "error")) {
        if (!idVal) {
            return invalidRequest("Invalid Request: response without id", value);
        }
        JSONRPCResponse resp;
        resp.FromValue(value);
        return Message{std::move(resp)};
    }

    return invalidRequest("Invalid Request: missing method", value);
}

DecodeResult DecodeMessage(const std::string& bytes) {
    JSONValue value;
    try {
        value = ParseJSON(bytes);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("DecodeMessage: parse error: {}", e.what());
        DecodeError err;
        err.code = JSONRPCErrorCodes::ParseError;
        err.message = "Parse error";
        return err;
    }
    return DecodeMessageValue(value);
}

std::variant<DecodedBatch, DecodeError> DecodeBatch(const std::string& bytes) {
    JSONValue value;
    try {
        value = ParseJSON(bytes);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("DecodeBatch: parse error: {}", e.what());
        DecodeError err;
        err.code = JSONRPCErrorCodes::ParseError;
        err.message = "Parse error";
        return err;
    }

    DecodedBatch batch;
    if (!value.IsArray()) {
        batch.entries.push_back(DecodeMessageValue(value));
        return batch;
    }
    const auto& arr = std::get<JSONValue::Array>(value.value);
    if (arr.empty()) {
        DecodeError err;
        err.code = JSONRPCErrorCodes::InvalidRequest;
        err.message = "Invalid Request: empty batch";
        return err;
    }
    batch.isArray = true;
    batch.entries.reserve(arr.size());
    for (const auto& entry : arr) {
        batch.entries.push_back(DecodeMessageValue(entry ? *entry : JSONValue(nullptr)));
    }
    return batch;
}

std::string EncodeMessage(const Message& message) {
    return std::visit([](const auto& m) { return m.Serialize(); }, message);
}

MessageKind KindOf(const Message& message) {
    switch (message.index()) {
        case 0: return MessageKind::Request;
        case 1: return MessageKind::Response;
        default: return MessageKind::Notification;
    }
}

std::unique_ptr<JSONRPCResponse> MakeDecodeErrorResponse(const DecodeError& error) {
    return CreateErrorResponse(error.hasId ? error.id : JSONRPCId{nullptr}, error.code, error.message);
}

} // namespace memgate
