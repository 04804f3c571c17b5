//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationPump.h
// Purpose: Server-initiated notifications onto per-session outbound queues, and SSE frame formatting
//==========================================================================================================
#pragma once

#include <optional>
#include <string>

#include "memgate/JSONRPCTypes.h"
#include "memgate/SessionRegistry.h"

namespace memgate {

//==========================================================================================================
// NotificationPump
// Purpose: Lets any component announce something to a session independently of request/response pairing.
//          Messages are delivered by the session's stream at its next drain, FIFO within the session.
// Notes:
//   Pushing to a session that no longer exists (or has no stream queue) is a silent no-op.
//==========================================================================================================
class NotificationPump {
public:
    explicit NotificationPump(SessionRegistry& sessions);

    // Enqueues a notification. Returns false when the session or its queue is gone.
    bool Push(const std::string& sessionId, const std::string& method, const JSONValue& params);
    bool Push(const std::string& sessionId, const JSONRPCNotification& notification);

    // Mirrors a serialized response onto the session stream.
    bool PushResponse(const std::string& sessionId, const JSONRPCResponse& response);

    //==========================================================================================================
    // MakeSessionEvent
    // Purpose: Builds session.connected / session.heartbeat / session.disconnected notifications.
    // Returns:
    //   Notification with params { session_id, timestamp }.
    //==========================================================================================================
    static JSONRPCNotification MakeSessionEvent(const char* method, const std::string& sessionId);

    //==========================================================================================================
    // FormatSseFrame
    // Purpose: Frames one JSON payload as a Server-Sent-Events message.
    // Args:
    //   payload: Serialized JSON (single line).
    //   eventType: When set, emitted as an "event:" line before the data line.
    // Returns:
    //   "data: <payload>\n\n" or "event: <type>\ndata: <payload>\n\n".
    //==========================================================================================================
    static std::string FormatSseFrame(const std::string& payload,
                                      const std::optional<std::string>& eventType = std::nullopt);

private:
    SessionRegistry& sessions;
};

} // namespace memgate
