#include <docdrop/messenger/send_tracker.h>

#include <spdlog/spdlog.h>

namespace docdrop::messenger {

void SendTracker::succeeded(MessageId temporaryId, MessageId finalId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_.erase(temporaryId) > 0) {
            spdlog::debug("Dropping late confirmation for message {}", temporaryId);
            return;
        }
        sent_[temporaryId] = finalId;
    }
    cv_.notify_all();
}

void SendTracker::failed(MessageId temporaryId, std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_.erase(temporaryId) > 0) {
            spdlog::debug("Dropping late send failure for message {}: {}", temporaryId, reason);
            return;
        }
        failures_[temporaryId] = std::move(reason);
    }
    cv_.notify_all();
}

Result<MessageId> SendTracker::await(MessageId temporaryId, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool done = cv_.wait_for(lock, timeout, [&] {
        return sent_.count(temporaryId) > 0 || failures_.count(temporaryId) > 0;
    });
    if (!done) {
        abandoned_.insert(temporaryId);
        return Error{ErrorCode::Timeout, "message send was not confirmed"};
    }
    if (auto it = failures_.find(temporaryId); it != failures_.end()) {
        Error err{ErrorCode::NetworkError, "message send failed: " + it->second};
        failures_.erase(it);
        return err;
    }
    auto it = sent_.find(temporaryId);
    const MessageId finalId = it->second;
    sent_.erase(it);
    return finalId;
}

std::size_t SendTracker::unclaimed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_.size() + failures_.size();
}

std::size_t SendTracker::abandoned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return abandoned_.size();
}

} // namespace docdrop::messenger
