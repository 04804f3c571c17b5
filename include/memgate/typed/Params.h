//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Params.h
// Purpose: Typed views of JSON-RPC params for each routed method and each memory tool. Parsing a params
//          value of the wrong shape throws errors::McpException with InvalidParams.
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "memgate/Protocol.h"
#include "memgate/errors/Errors.h"

namespace memgate {
namespace typed {

//------------------------------ Shape helpers ------------------------------
namespace detail {

inline JSONValue missingData(const std::string& key) {
    JSONValue::Object d;
    d["missing"] = std::make_shared<JSONValue>(key);
    return JSONValue{d};
}

// Absent or null params read as an empty object; any other non-object is rejected.
inline JSONValue objectParams(const std::optional<JSONValue>& params, const std::string& context) {
    if (!params.has_value() || params->IsNull()) {
        return JSONValue{JSONValue::Object{}};
    }
    if (!params->IsObject()) {
        throw errors::invalidParams(context + ": params must be an object");
    }
    return *params;
}

inline std::string requireString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || v->IsNull()) {
        throw errors::invalidParams("Missing required parameter: " + key, missingData(key));
    }
    if (!v->IsString()) {
        throw errors::invalidParams("Parameter '" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

inline std::optional<std::string> optionalString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || v->IsNull()) return std::nullopt;
    if (!v->IsString()) {
        throw errors::invalidParams("Parameter '" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

inline std::optional<JSONValue> optionalObject(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || v->IsNull()) return std::nullopt;
    if (!v->IsObject()) {
        throw errors::invalidParams("Parameter '" + key + "' must be an object");
    }
    return *v;
}

inline int64_t integerInRange(const JSONValue& obj, const std::string& key, int64_t defaultValue,
                              int64_t minValue, int64_t maxValue) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || v->IsNull()) return defaultValue;
    if (!std::holds_alternative<int64_t>(v->value)) {
        throw errors::invalidParams("Parameter '" + key + "' must be an integer");
    }
    const int64_t n = std::get<int64_t>(v->value);
    if (n < minValue || n > maxValue) {
        throw errors::invalidParams("Parameter '" + key + "' must be between " + std::to_string(minValue) +
                                    " and " + std::to_string(maxValue));
    }
    return n;
}

} // namespace detail

//------------------------------ Method params ------------------------------
struct InitializeParams {
    std::optional<std::string> protocolVersion;
    JSONValue capabilities{JSONValue::Object{}};
    std::optional<Implementation> clientInfo;
};

inline InitializeParams parseInitializeParams(const std::optional<JSONValue>& params) {
    const JSONValue obj = detail::objectParams(params, Methods::Initialize);
    InitializeParams out;
    out.protocolVersion = detail::optionalString(obj, "protocolVersion");
    if (auto caps = detail::optionalObject(obj, "capabilities")) {
        out.capabilities = std::move(*caps);
    }
    if (auto info = detail::optionalObject(obj, "clientInfo")) {
        Implementation impl;
        impl.name = detail::optionalString(*info, "name").value_or("");
        impl.version = detail::optionalString(*info, "version").value_or("");
        out.clientInfo = std::move(impl);
    }
    return out;
}

struct CallToolParams {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
};

inline CallToolParams parseCallToolParams(const std::optional<JSONValue>& params) {
    const JSONValue obj = detail::objectParams(params, Methods::CallTool);
    CallToolParams out;
    out.name = detail::requireString(obj, "name");
    if (out.name.empty()) {
        throw errors::invalidParams("Missing required parameter: name", detail::missingData("name"));
    }
    if (auto args = detail::optionalObject(obj, "arguments")) {
        out.arguments = std::move(*args);
    }
    return out;
}

struct ReadResourceParams {
    std::string uri;
};

inline ReadResourceParams parseReadResourceParams(const std::optional<JSONValue>& params) {
    const JSONValue obj = detail::objectParams(params, Methods::ReadResource);
    return ReadResourceParams{detail::requireString(obj, "uri")};
}

struct GetPromptParams {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
};

inline GetPromptParams parseGetPromptParams(const std::optional<JSONValue>& params) {
    const JSONValue obj = detail::objectParams(params, Methods::GetPrompt);
    GetPromptParams out;
    out.name = detail::requireString(obj, "name");
    if (auto args = detail::optionalObject(obj, "arguments")) {
        out.arguments = std::move(*args);
    }
    return out;
}

struct WikiLinksParams {
    std::string text;
};

inline WikiLinksParams parseWikiLinksParams(const std::optional<JSONValue>& params) {
    const JSONValue obj = detail::objectParams(params, "memory/wiki_links");
    return WikiLinksParams{detail::requireString(obj, "text")};
}

//------------------------------ Memory tool arguments ------------------------------
// tenant_id/user_id arguments are honoured only for sessions without an authenticated identity.
struct MemorySearchArgs {
    std::string query;
    int64_t limit{10};
    std::optional<std::string> tenantId;
};

inline MemorySearchArgs parseMemorySearchArgs(const JSONValue& args) {
    MemorySearchArgs out;
    out.query = detail::requireString(args, "query");
    out.tenantId = detail::optionalString(args, "tenant_id");
    out.limit = detail::integerInRange(args, "limit", 10, 1, 100);
    return out;
}

struct MemoryCreateArgs {
    std::string content;
    JSONValue metadata{JSONValue::Object{}};
    std::optional<std::string> tenantId;
    std::optional<std::string> userId;
};

inline MemoryCreateArgs parseMemoryCreateArgs(const JSONValue& args) {
    MemoryCreateArgs out;
    out.content = detail::requireString(args, "content");
    out.tenantId = detail::optionalString(args, "tenant_id");
    out.userId = detail::optionalString(args, "user_id");
    if (auto meta = detail::optionalObject(args, "metadata")) {
        out.metadata = std::move(*meta);
    }
    return out;
}

struct MemoryUpdateArgs {
    std::string memoryId;
    std::optional<std::string> content;
    std::optional<JSONValue> metadata;
    std::optional<std::string> tenantId;
    std::optional<std::string> userId;
};

inline MemoryUpdateArgs parseMemoryUpdateArgs(const JSONValue& args) {
    MemoryUpdateArgs out;
    out.memoryId = detail::requireString(args, "memory_id");
    out.content = detail::optionalString(args, "content");
    out.metadata = detail::optionalObject(args, "metadata");
    out.tenantId = detail::optionalString(args, "tenant_id");
    out.userId = detail::optionalString(args, "user_id");
    return out;
}

struct MemoryDeleteArgs {
    std::string memoryId;
    std::optional<std::string> tenantId;
    std::optional<std::string> userId;
};

inline MemoryDeleteArgs parseMemoryDeleteArgs(const JSONValue& args) {
    MemoryDeleteArgs out;
    out.memoryId = detail::requireString(args, "memory_id");
    out.tenantId = detail::optionalString(args, "tenant_id");
    out.userId = detail::optionalString(args, "user_id");
    return out;
}

struct MemoryListArgs {
    int64_t skip{0};
    int64_t limit{50};
    std::optional<std::string> tenantId;
};

inline MemoryListArgs parseMemoryListArgs(const JSONValue& args) {
    MemoryListArgs out;
    out.tenantId = detail::optionalString(args, "tenant_id");
    out.skip = detail::integerInRange(args, "skip", 0, 0, INT32_MAX);
    out.limit = detail::integerInRange(args, "limit", 50, 1, 500);
    return out;
}

struct WikiLinkExtractArgs {
    std::string text;
};

inline WikiLinkExtractArgs parseWikiLinkExtractArgs(const JSONValue& args) {
    return WikiLinkExtractArgs{detail::requireString(args, "text")};
}

struct WikiLinkGraphArgs {
    std::optional<std::string> tenantId;
    std::optional<std::string> entity;
    int64_t depth{2};
};

inline WikiLinkGraphArgs parseWikiLinkGraphArgs(const JSONValue& args) {
    WikiLinkGraphArgs out;
    out.tenantId = detail::optionalString(args, "tenant_id");
    out.entity = detail::optionalString(args, "entity");
    out.depth = detail::integerInRange(args, "depth", 2, 1, 5);
    return out;
}

} // namespace typed
} // namespace memgate
