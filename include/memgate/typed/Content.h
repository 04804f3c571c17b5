//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Content blocks returned by memgate (tool text, prompt messages, JSON resource contents)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "memgate/Protocol.h"

namespace memgate {
namespace typed {

//------------------------------ Builders ------------------------------
// {"type":"text","text":...}
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// Single text block; isError marks a tool-level failure the model can read.
inline CallToolResult makeTextResult(const std::string& text, bool isError = false) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    r.isError = isError;
    return r;
}

inline JSONValue makePromptMessage(const std::string& role, const std::string& text) {
    JSONValue::Object msg;
    msg["role"] = std::make_shared<JSONValue>(role);
    msg["content"] = std::make_shared<JSONValue>(makeText(text));
    return JSONValue{msg};
}

//==========================================================================================================
// makeJsonResourceResult
// Purpose: resources/read result carrying one application/json item for uri.
//==========================================================================================================
inline JSONValue makeJsonResourceResult(const std::string& uri, const JSONValue& body) {
    JSONValue::Object item;
    item["uri"] = std::make_shared<JSONValue>(uri);
    item["mimeType"] = std::make_shared<JSONValue>(std::string("application/json"));
    item["text"] = std::make_shared<JSONValue>(SerializeJSON(body));
    JSONValue::Array contents;
    contents.push_back(std::make_shared<JSONValue>(item));
    JSONValue::Object result;
    result["contents"] = std::make_shared<JSONValue>(contents);
    return JSONValue{result};
}

//------------------------------ Inspectors ------------------------------
inline std::optional<std::string> getText(const JSONValue& v) {
    if (GetStringMember(v, "type") != std::optional<std::string>("text")) return std::nullopt;
    return GetStringMember(v, "text");
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    for (const auto& v : r.content) {
        auto t = getText(v);
        if (t.has_value()) return t;
    }
    return std::nullopt;
}

// Same as firstText for a serialized tools/call result ({content:[...]}).
inline std::optional<std::string> firstTextOfResult(const JSONValue& result) {
    const JSONValue* content = FindMember(result, "content");
    if (!content || !content->IsArray()) return std::nullopt;
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (!item) continue;
        auto t = getText(*item);
        if (t.has_value()) return t;
    }
    return std::nullopt;
}

} // namespace typed
} // namespace memgate
