//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutboundQueue.h
// Purpose: Unbounded per-session FIFO of serialized messages awaiting delivery on the session stream
//==========================================================================================================
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace memgate {

//==========================================================================================================
// OutboundQueue
// Purpose: Multi-producer, single-consumer FIFO. Producers (notification pump, request handlers mirroring
//          responses) Push from any thread; the session's stream task Drains. An optional waker is invoked
//          after every successful Push and on Close so the consumer can stop waiting.
// Notes:
//   The waker runs on the producer's thread outside the queue lock; it must only schedule work.
//==========================================================================================================
class OutboundQueue {
public:
    using Waker = std::function<void()>;

    OutboundQueue() = default;
    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    // Appends a message. Returns false (message dropped) after Close.
    bool Push(std::string message);

    // Removes and returns every pending message in FIFO order.
    std::deque<std::string> Drain();

    // Rejects further pushes and wakes the consumer. Pending messages stay drainable.
    void Close();

    bool IsClosed() const;
    std::size_t Size() const;

    // Installs (or clears, with an empty function) the consumer's waker.
    void SetWaker(Waker waker);

private:
    void wake();

    mutable std::mutex mutex;
    std::deque<std::string> messages;
    bool closed{false};
    Waker waker;
};

} // namespace memgate
