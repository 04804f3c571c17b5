//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Per-client protocol session state owned by the SessionRegistry
//==========================================================================================================
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

#include "memgate/Protocol.h"

namespace memgate {

//==========================================================================================================
// SessionState
// Purpose: Lifecycle of a session. Uninitialized until initialize succeeds; Closed only on snapshots taken
//          during teardown.
//==========================================================================================================
enum class SessionState { Uninitialized, Initialized, Closed };

const char* ToString(SessionState state);

//==========================================================================================================
// Session
// Purpose: Logical client connection state, independent of the transport connection.
// Fields:
//   id: Opaque session identifier (path segment for HTTP, generated for stdio).
//   capabilities: Client capabilities recorded by initialize (capability name -> configuration).
//   clientInfo: Client implementation info recorded by initialize.
//   tenantId/userId: Opaque identity assigned by the auth collaborator; absent when unauthenticated.
//   metadata: Free-form annotations (e.g. negotiated protocol version, transport name).
//   outOfOrderCalls: Requests other than initialize/ping received while Uninitialized.
//   streamAttached: True while a live connection (SSE stream or stdio loop) is bound to the session.
//   reapExempt: Session lives exactly as long as its transport loop (stdio); the idle reaper skips it.
//==========================================================================================================
struct Session {
    using Clock = std::chrono::system_clock;

    std::string id;
    SessionState state{SessionState::Uninitialized};
    Clock::time_point createdAt{};
    Clock::time_point lastActivity{};
    JSONValue capabilities{JSONValue::Object{}};
    std::optional<Implementation> clientInfo;
    std::optional<std::string> tenantId;
    std::optional<std::string> userId;
    std::unordered_map<std::string, JSONValue> metadata;
    unsigned int outOfOrderCalls{0};
    bool streamAttached{false};
    bool reapExempt{false};

    bool IsInitialized() const { return state == SessionState::Initialized; }
};

// ISO-8601 UTC rendering (e.g. 2025-01-31T12:00:00.123Z) used for timestamps on the wire.
std::string FormatTimestamp(Session::Clock::time_point tp);

} // namespace memgate
