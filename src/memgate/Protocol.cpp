//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON serialization of MCP protocol structures
//==========================================================================================================

#include "memgate/Protocol.h"

namespace memgate {

JSONValue ToJSON(const Implementation& impl) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(impl.name);
    obj["version"] = std::make_shared<JSONValue>(impl.version);
    return JSONValue{obj};
}

JSONValue ToJSON(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools) {
        obj["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }
    if (caps.resources.has_value()) {
        JSONValue::Object res;
        res["subscribe"] = std::make_shared<JSONValue>(caps.resources->subscribe);
        obj["resources"] = std::make_shared<JSONValue>(res);
    }
    if (caps.prompts) {
        obj["prompts"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }
    if (caps.logging) {
        obj["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }
    return JSONValue{obj};
}

JSONValue ToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{obj};
}

JSONValue ToJSON(const CallToolResult& result) {
    JSONValue::Array content;
    for (const auto& item : result.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(content);
    if (result.isError) {
        obj["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue{obj};
}

JSONValue ToJSON(const Resource& resource) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(resource.uri);
    obj["name"] = std::make_shared<JSONValue>(resource.name);
    if (resource.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(resource.description.value());
    }
    if (resource.mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(resource.mimeType.value());
    }
    return JSONValue{obj};
}

JSONValue ToJSON(const Prompt& prompt) {
    JSONValue::Array args;
    for (const auto& a : prompt.arguments) {
        JSONValue::Object arg;
        arg["name"] = std::make_shared<JSONValue>(a.name);
        arg["description"] = std::make_shared<JSONValue>(a.description);
        arg["required"] = std::make_shared<JSONValue>(a.required);
        args.push_back(std::make_shared<JSONValue>(arg));
    }
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(prompt.name);
    obj["description"] = std::make_shared<JSONValue>(prompt.description);
    obj["arguments"] = std::make_shared<JSONValue>(args);
    return JSONValue{obj};
}

JSONValue ToJSON(const GetPromptResult& result) {
    JSONValue::Array messages;
    for (const auto& m : result.messages) {
        messages.push_back(std::make_shared<JSONValue>(m));
    }
    JSONValue::Object obj;
    obj["description"] = std::make_shared<JSONValue>(result.description);
    obj["messages"] = std::make_shared<JSONValue>(messages);
    return JSONValue{obj};
}

} // namespace memgate
