//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.h
// Purpose: Per-session MCP method dispatch (standard methods and memory/ extensions)
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "memgate/JSONRPCTypes.h"
#include "memgate/MemoryService.h"
#include "memgate/NotificationPump.h"
#include "memgate/Protocol.h"
#include "memgate/Session.h"
#include "memgate/SessionRegistry.h"
#include "memgate/ToolExecutor.h"

namespace memgate {

//==========================================================================================================
// MethodRouter
// Purpose: Maps a request method to its handler and turns the outcome into a JSON-RPC response.
//
// Dispatch table:
//   initialize, initialized, ping, tools/list, tools/call, resources/list, resources/read, prompts/list,
//   prompts/get, and memory/<suffix> (handlers registered with RegisterMemoryMethod; stats and wiki_links are
//   built in). Anything else answers MethodNotFound naming the method.
//
// Session state machine:
//   Uninitialized --initialize--> Initialized. Other calls while Uninitialized are served but logged and
//   counted in Session::outOfOrderCalls. initialized is idempotent.
//
// Error mapping:
//   Handlers throw errors::McpException for typed failures; any other std::exception becomes InternalError
//   with the exception message as data. Every response echoes the request id.
//
// Thread-safety:
//   Dispatch and HandleNotification may run concurrently for different sessions. Session state is only read
//   through SessionRegistry snapshots and mutated through SessionRegistry::Update.
//==========================================================================================================
class MethodRouter {
public:
    // Handler for memory/<suffix>. Receives raw params and a snapshot of the calling session.
    using MemoryMethodHandler = std::function<JSONValue(const std::optional<JSONValue>& params, const Session& session)>;

    MethodRouter(SessionRegistry& sessions, IToolExecutor& tools, IMemoryService& memory, NotificationPump& pump,
                 Implementation serverInfo);
    ~MethodRouter();
    MethodRouter(const MethodRouter&) = delete;
    MethodRouter& operator=(const MethodRouter&) = delete;

    //==========================================================================================================
    // Dispatch
    // Purpose: Handles one request for a session.
    // Args:
    //   sessionId: Session the request arrived on. A missing session answers SessionNotFound.
    //   request: Decoded request.
    // Returns:
    //   Exactly one response carrying request.id. Never null, never throws.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const std::string& sessionId, const JSONRPCRequest& request);

    // Handles a client notification (initialized, notifications/*). Never produces a response.
    void HandleNotification(const std::string& sessionId, const JSONRPCNotification& notification);

    // Registers (or replaces) the handler for memory/<suffix>.
    void RegisterMemoryMethod(const std::string& suffix, MemoryMethodHandler handler);

    const Implementation& GetServerInfo() const;
    std::vector<Prompt> ListPrompts() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace memgate
