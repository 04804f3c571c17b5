//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.cpp
// Purpose: Session lifecycle store implementation
//==========================================================================================================

#include "memgate/SessionRegistry.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "logging/Logger.h"

namespace memgate {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initialized: return "initialized";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

std::string FormatTimestamp(Session::Clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t t = Session::Clock::to_time_t(tp);
    std::tm buf{};
#ifdef _WIN32
    ::gmtime_s(&buf, &t);
#else
    ::gmtime_r(&t, &buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

SessionRegistry::~SessionRegistry() {
    CloseAll();
}

std::shared_ptr<OutboundQueue> SessionRegistry::Create(const std::string& id, bool withOutboundQueue) {
    if (id.empty()) {
        throw std::invalid_argument("SessionRegistry::Create: empty session id");
    }
    std::shared_ptr<OutboundQueue> previous;
    std::shared_ptr<OutboundQueue> queue = withOutboundQueue ? std::make_shared<OutboundQueue>() : nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = sessions.find(id);
        if (it != sessions.end()) {
            previous = std::move(it->second.queue);
            sessions.erase(it);
        }
        Entry entry;
        entry.session.id = id;
        entry.session.createdAt = Clock::now();
        entry.session.lastActivity = entry.session.createdAt;
        entry.queue = queue;
        sessions.emplace(id, std::move(entry));
    }
    if (previous) {
        LOG_INFO("Session {} reset by reconnect", id);
        previous->Close();
    } else {
        LOG_DEBUG("Session {} created", id);
    }
    return queue;
}

std::optional<Session> SessionRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    return it->second.session;
}

bool SessionRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.find(id) != sessions.end();
}

bool SessionRegistry::Touch(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return false;
    }
    it->second.session.lastActivity = Clock::now();
    return true;
}

bool SessionRegistry::Update(const std::string& id, const std::function<void(Session&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return false;
    }
    fn(it->second.session);
    return true;
}

bool SessionRegistry::Close(const std::string& id) {
    std::shared_ptr<OutboundQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return false;
        }
        queue = std::move(it->second.queue);
        sessions.erase(it);
    }
    if (queue) {
        queue->Close();
    }
    LOG_DEBUG("Session {} closed", id);
    return true;
}

bool SessionRegistry::Close(const std::string& id, const std::shared_ptr<OutboundQueue>& owner) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = sessions.find(id);
        if (it == sessions.end() || it->second.queue != owner) {
            return false;
        }
        sessions.erase(it);
    }
    if (owner) {
        owner->Close();
    }
    LOG_DEBUG("Session {} closed by its stream", id);
    return true;
}

bool SessionRegistry::Enqueue(const std::string& id, std::string message) {
    std::shared_ptr<OutboundQueue> queue = Queue(id);
    if (!queue) {
        LOG_DEBUG("Enqueue: no outbound queue for session {}; message dropped", id);
        return false;
    }
    return queue->Push(std::move(message));
}

std::shared_ptr<OutboundQueue> SessionRegistry::Queue(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return nullptr;
    }
    return it->second.queue;
}

std::vector<Session> SessionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Session> out;
    out.reserve(sessions.size());
    for (const auto& [id, entry] : sessions) {
        out.push_back(entry.session);
    }
    return out;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}

std::vector<std::string> SessionRegistry::ReapIdle(std::chrono::milliseconds maxIdle) {
    const auto cutoff = Clock::now() - maxIdle;
    std::vector<std::string> reaped;
    std::vector<std::shared_ptr<OutboundQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto it = sessions.begin(); it != sessions.end();) {
            const Session& s = it->second.session;
            if (!s.reapExempt && s.lastActivity < cutoff) {
                reaped.push_back(it->first);
                if (it->second.queue) {
                    queues.push_back(std::move(it->second.queue));
                }
                it = sessions.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& q : queues) {
        q->Close();
    }
    for (const auto& id : reaped) {
        LOG_INFO("Session {} expired after inactivity", id);
    }
    return reaped;
}

void SessionRegistry::CloseAll() {
    std::unordered_map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(mutex);
        drained.swap(sessions);
    }
    for (auto& [id, entry] : drained) {
        if (entry.queue) {
            entry.queue->Close();
        }
    }
}

} // namespace memgate
