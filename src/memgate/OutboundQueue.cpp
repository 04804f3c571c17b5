//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutboundQueue.cpp
// Purpose: Per-session outbound FIFO implementation
//==========================================================================================================

#include "memgate/OutboundQueue.h"

namespace memgate {

bool OutboundQueue::Push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return false;
        }
        messages.push_back(std::move(message));
    }
    wake();
    return true;
}

std::deque<std::string> OutboundQueue::Drain() {
    std::lock_guard<std::mutex> lock(mutex);
    std::deque<std::string> out;
    out.swap(messages);
    return out;
}

void OutboundQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
    }
    wake();
}

bool OutboundQueue::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

std::size_t OutboundQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return messages.size();
}

void OutboundQueue::SetWaker(Waker w) {
    std::lock_guard<std::mutex> lock(mutex);
    waker = std::move(w);
}

void OutboundQueue::wake() {
    Waker w;
    {
        std::lock_guard<std::mutex> lock(mutex);
        w = waker;
    }
    if (w) {
        w();
    }
}

} // namespace memgate
