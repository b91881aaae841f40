#pragma once

#include <docdrop/messenger/messenger.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace docdrop::messenger {

/**
 * Maps the temporary id of a pending outgoing message to its final server id. The transport's
 * receive thread reports outcomes; the sending thread waits for one. A waiter that gives up
 * marks the id abandoned so a late outcome is dropped instead of accumulating.
 */
class SendTracker {
public:
    void succeeded(MessageId temporaryId, MessageId finalId);
    void failed(MessageId temporaryId, std::string reason);

    // Final id, NetworkError when the send failed, Timeout when no outcome arrived in time.
    Result<MessageId> await(MessageId temporaryId, std::chrono::milliseconds timeout);

    // Outcomes recorded but not yet claimed by a waiter.
    std::size_t unclaimed() const;
    std::size_t abandoned() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<MessageId, MessageId> sent_;
    std::map<MessageId, std::string> failures_;
    std::set<MessageId> abandoned_;
};

} // namespace docdrop::messenger
