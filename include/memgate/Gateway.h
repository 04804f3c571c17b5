//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.h
// Purpose: Composition root: configuration, collaborators, transports and the idle session reaper
//==========================================================================================================
#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

#include "memgate/HTTPServer.hpp"
#include "memgate/MemoryService.h"
#include "memgate/MethodRouter.h"
#include "memgate/NotificationPump.h"
#include "memgate/SessionRegistry.h"
#include "memgate/StdioTransport.hpp"
#include "memgate/ToolExecutor.h"

namespace memgate {

//==========================================================================================================
// GatewayConfig
// Purpose: Runtime configuration. FromEnvironment reads MEMGATE_* variables; the server executable then
//          applies --key=value overrides.
// Fields:
//   transport: stdio or http (MEMGATE_TRANSPORT)
//   listenUri: http(s)://host:port[?cert=&key=] (MEMGATE_LISTEN)
//   heartbeatMs: SSE heartbeat interval (MEMGATE_HEARTBEAT_MS, default 30000)
//   idleTimeoutMs: Idle session reaping threshold, 0 disables (MEMGATE_SESSION_IDLE_TIMEOUT_MS)
//   ioThreads: HTTP io_context threads (MEMGATE_IO_THREADS)
//   namedEvents: SSE "event:" framing (MEMGATE_SSE_NAMED_EVENTS)
//   bearerToken/bearerTenant/bearerUser: Static bearer token and the identity it maps to
//     (MEMGATE_BEARER_TOKEN, MEMGATE_BEARER_TENANT, MEMGATE_BEARER_USER). Empty token disables auth.
//==========================================================================================================
struct GatewayConfig {
    enum class Transport { Stdio, Http };

    Transport transport{Transport::Stdio};
    std::string listenUri{"http://127.0.0.1:8080"};
    std::uint64_t heartbeatMs{30000};
    std::uint64_t idleTimeoutMs{1800000};
    unsigned int ioThreads{2};
    bool namedEvents{false};
    std::string bearerToken;
    std::string bearerTenant{"default"};
    std::string bearerUser{"anonymous"};

    static GatewayConfig FromEnvironment();

    // "stdio" | "http" (case-insensitive). Throws std::invalid_argument otherwise.
    static Transport ParseTransport(const std::string& value);
};

//==========================================================================================================
// Gateway
// Purpose: Owns the session registry, memory service, tool executor, notification pump and router, and
//          builds transports wired to them. Collaborators live for the lifetime of the Gateway.
//==========================================================================================================
class Gateway {
public:
    explicit Gateway(GatewayConfig config);
    Gateway(GatewayConfig config, std::unique_ptr<IMemoryService> memory);
    ~Gateway();
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    const GatewayConfig& Config() const;
    SessionRegistry& Sessions();
    IMemoryService& Memory();
    NotificationPump& Pump();
    MethodRouter& Router();

    std::unique_ptr<StdioTransport> MakeStdioTransport(std::istream& in, std::ostream& out);

    //==========================================================================================================
    // MakeHTTPServer
    // Purpose: Builds an SSE server from listenUri, heartbeatMs, ioThreads and namedEvents, with bearer auth
    //          enabled when a token is configured.
    // Throws:
    //   std::invalid_argument for a malformed listen URI.
    //==========================================================================================================
    std::unique_ptr<HTTPServer> MakeHTTPServer();

    // Starts the background reaper (no-op when idleTimeoutMs is 0 or it already runs).
    void StartReaper();

    // One reaping pass. Returns the number of sessions closed.
    std::size_t ReapIdleSessions();

    // Stops the reaper and closes every session.
    void Shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace memgate
