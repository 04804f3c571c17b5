//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names, and gateway notification names
//==========================================================================================================

#pragma once

#include "memgate/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace memgate {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol revision negotiated by initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (serverInfo / clientInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Server capabilities advertised by initialize. Present members serialize as objects.
struct ResourcesCapability {
    bool subscribe = false;
};

struct ServerCapabilities {
    bool tools = true;
    std::optional<ResourcesCapability> resources;
    bool prompts = true;
    bool logging = true;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor returned verbatim by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

struct GetPromptResult {
    std::string description;
    std::vector<JSONValue> messages;  // Array of message objects
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Custom methods are routed by suffix after this prefix
    constexpr const char* MemoryPrefix = "memory/";
    // Client notifications live under this prefix and are never answered
    constexpr const char* NotificationPrefix = "notifications/";
    constexpr const char* InitializedNotification = "notifications/initialized";
}

///////////////////////////////////////// Notifications ///////////////////////////////////////////
// Server-to-client notifications delivered on the session stream
namespace Notifications {
    constexpr const char* SessionConnected = "session.connected";
    constexpr const char* SessionHeartbeat = "session.heartbeat";
    constexpr const char* SessionDisconnected = "session.disconnected";
    constexpr const char* MemoryCreated = "memory.created";
}

// Serialization helpers for the structures above.
JSONValue ToJSON(const Implementation& impl);
JSONValue ToJSON(const ServerCapabilities& caps);
JSONValue ToJSON(const Tool& tool);
JSONValue ToJSON(const CallToolResult& result);
JSONValue ToJSON(const Resource& resource);
JSONValue ToJSON(const Prompt& prompt);
JSONValue ToJSON(const GetPromptResult& result);

} // namespace memgate
