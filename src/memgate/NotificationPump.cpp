//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationPump.cpp
// Purpose: Notification enqueueing and SSE framing
//==========================================================================================================

#include "memgate/NotificationPump.h"

#include "logging/Logger.h"

namespace memgate {

NotificationPump::NotificationPump(SessionRegistry& sessions) : sessions(sessions) {}

bool NotificationPump::Push(const std::string& sessionId, const std::string& method, const JSONValue& params) {
    return Push(sessionId, JSONRPCNotification(method, params));
}

bool NotificationPump::Push(const std::string& sessionId, const JSONRPCNotification& notification) {
    const bool queued = sessions.Enqueue(sessionId, notification.Serialize());
    if (queued) {
        LOG_DEBUG("Notification {} queued for session {}", notification.method, sessionId);
    }
    return queued;
}

bool NotificationPump::PushResponse(const std::string& sessionId, const JSONRPCResponse& response) {
    return sessions.Enqueue(sessionId, response.Serialize());
}

JSONRPCNotification NotificationPump::MakeSessionEvent(const char* method, const std::string& sessionId) {
    JSONValue::Object params;
    params["session_id"] = std::make_shared<JSONValue>(sessionId);
    params["timestamp"] = std::make_shared<JSONValue>(FormatTimestamp(Session::Clock::now()));
    return JSONRPCNotification(method, JSONValue{params});
}

std::string NotificationPump::FormatSseFrame(const std::string& payload, const std::optional<std::string>& eventType) {
    std::string frame;
    frame.reserve(payload.size() + 32);
    if (eventType.has_value()) {
        frame += "event: ";
        frame += *eventType;
        frame += "\n";
    }
    frame += "data: ";
    frame += payload;
    frame += "\n\n";
    return frame;
}

} // namespace memgate
