#pragma once

#include <docdrop/messenger/messenger.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace docdrop::messenger {

/**
 * Single intake channel between the transport (producer) and the dispatch loop (consumer).
 * Unbounded; closing wakes every waiter and rejects further pushes while letting the consumer
 * drain what is already queued.
 */
class UpdateQueue {
public:
    UpdateQueue() = default;
    UpdateQueue(const UpdateQueue&) = delete;
    UpdateQueue& operator=(const UpdateQueue&) = delete;

    // False once closed.
    bool push(InboundUpdate update);

    // nullopt on timeout, or when closed and drained.
    std::optional<InboundUpdate> pop(std::chrono::milliseconds timeout);

    std::optional<InboundUpdate> tryPop();

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<InboundUpdate> items_;
    bool closed_{false};
};

} // namespace docdrop::messenger
