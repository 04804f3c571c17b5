//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.h
// Purpose: Concurrency-safe store of sessions and their outbound queues
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "memgate/OutboundQueue.h"
#include "memgate/Session.h"

namespace memgate {

//==========================================================================================================
// SessionRegistry
// Purpose: Owns every live Session and its OutboundQueue behind a single mutex. Transports and the method
//          router only see snapshots (Get/Snapshot) or mutate through Update/Touch under the lock.
// Notes:
//   - Sessions are ephemeral and transport-bound: Create on an existing id resets it (fresh state, fresh
//     queue) and closes the queue the previous connection was draining.
//   - Queues are shared_ptr so a stream task can keep draining after the session was removed; a closed
//     queue rejects further pushes.
//==========================================================================================================
class SessionRegistry {
public:
    using Clock = Session::Clock;

    SessionRegistry() = default;
    ~SessionRegistry();
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    //==========================================================================================================
    // Create
    // Purpose: Creates the session, or resets it when the id already exists.
    // Args:
    //   id: Opaque session identifier (non-empty).
    //   withOutboundQueue: When false (stdio), no queue is attached and Enqueue becomes a no-op.
    // Returns:
    //   The session's fresh outbound queue, or nullptr when withOutboundQueue is false.
    // Throws:
    //   std::invalid_argument when id is empty.
    //==========================================================================================================
    std::shared_ptr<OutboundQueue> Create(const std::string& id, bool withOutboundQueue = true);

    std::optional<Session> Get(const std::string& id) const;
    bool Contains(const std::string& id) const;

    // Updates last-activity. Returns false when the session does not exist.
    bool Touch(const std::string& id);

    // Runs fn on the live session under the registry lock. fn must not call back into the registry.
    bool Update(const std::string& id, const std::function<void(Session&)>& fn);

    // Removes the session and closes its queue. Returns false when it did not exist.
    bool Close(const std::string& id);

    // Removes the session only while it is still bound to owner. Used by stream teardown so a stale
    // connection never deletes the session its reconnect created.
    bool Close(const std::string& id, const std::shared_ptr<OutboundQueue>& owner);

    // Pushes a serialized message onto the session's queue. Missing session or queue is a no-op (false).
    bool Enqueue(const std::string& id, std::string message);

    std::shared_ptr<OutboundQueue> Queue(const std::string& id) const;

    // Copies every session; the lock is released before the caller iterates.
    std::vector<Session> Snapshot() const;
    std::size_t Size() const;

    //==========================================================================================================
    // ReapIdle
    // Purpose: Closes sessions whose last activity is older than maxIdle, attached SSE streams included (closing
    //          the queue ends the stream). Sessions marked reapExempt are skipped.
    // Returns:
    //   Ids of the sessions removed.
    //==========================================================================================================
    std::vector<std::string> ReapIdle(std::chrono::milliseconds maxIdle);

    // Removes every session and closes every queue (shutdown).
    void CloseAll();

private:
    struct Entry {
        Session session;
        std::shared_ptr<OutboundQueue> queue;
    };

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> sessions;
};

} // namespace memgate
