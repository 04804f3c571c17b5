//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecutor.h
// Purpose: Tool execution seam used by tools/list and tools/call, and its memory-service adapter
//==========================================================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "memgate/MemoryService.h"
#include "memgate/Protocol.h"

namespace memgate {

//==========================================================================================================
// ToolCallContext
// Purpose: Caller identity forwarded with each tool call. tenantId/userId are set when the session carries an
//          authenticated identity.
//==========================================================================================================
struct ToolCallContext {
    std::string sessionId;
    std::optional<std::string> tenantId;
    std::optional<std::string> userId;
};

//==========================================================================================================
// ToolResult
// Purpose: Shaped tool output plus notifications announcing side effects (pushed to the calling session).
//==========================================================================================================
struct ToolResult {
    CallToolResult result;
    std::vector<JSONRPCNotification> notifications;
};

//==========================================================================================================
// IToolExecutor
// Purpose: Interface the method router calls for tools/list and tools/call.
// Methods:
//   ListDescriptors(): Immutable descriptors registered at construction, in registration order.
//   HasTool(name): True when name is a registered tool.
//   Execute(name, arguments, context): Runs the tool.
// Notes:
//   Execute throws errors::McpException: InvalidParams for unknown tools or malformed arguments,
//   InternalError when the downstream service fails. It never retries.
//==========================================================================================================
class IToolExecutor {
public:
    virtual ~IToolExecutor() = default;
    virtual std::vector<Tool> ListDescriptors() const = 0;
    virtual bool HasTool(const std::string& name) const = 0;
    virtual ToolResult Execute(const std::string& name, const JSONValue& arguments,
                               const ToolCallContext& context) = 0;
};

//==========================================================================================================
// MemoryToolExecutor
// Purpose: IToolExecutor over IMemoryService exposing the memory_* tools plus wiki_link_extract and
//          wiki_link_graph. Results are text content blocks; search, list and the wiki tools render JSON text.
// Notes:
//   memory_update and memory_delete only touch memories owned by the caller's resolved tenant and user.
//==========================================================================================================
class MemoryToolExecutor : public IToolExecutor {
public:
    static constexpr const char* DefaultTenant = "default";
    static constexpr const char* DefaultUser = "anonymous";
    static constexpr std::size_t ListPreviewChars = 200;
    static constexpr std::size_t GraphScanLimit = 1000;

    explicit MemoryToolExecutor(IMemoryService& memory);

    std::vector<Tool> ListDescriptors() const override;
    bool HasTool(const std::string& name) const override;
    ToolResult Execute(const std::string& name, const JSONValue& arguments,
                       const ToolCallContext& context) override;

private:
    ToolResult search(const JSONValue& arguments, const ToolCallContext& context);
    ToolResult create(const JSONValue& arguments, const ToolCallContext& context);
    ToolResult update(const JSONValue& arguments, const ToolCallContext& context);
    ToolResult remove(const JSONValue& arguments, const ToolCallContext& context);
    ToolResult list(const JSONValue& arguments, const ToolCallContext& context);
    ToolResult extractLinks(const JSONValue& arguments);
    ToolResult linkGraph(const JSONValue& arguments, const ToolCallContext& context);

    IMemoryService& memory;
    std::vector<Tool> descriptors;
};

} // namespace memgate
