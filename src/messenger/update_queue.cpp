#include <docdrop/messenger/update_queue.h>

namespace docdrop::messenger {

bool UpdateQueue::push(InboundUpdate update) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(update));
    }
    cv_.notify_one();
    return true;
}

std::optional<InboundUpdate> UpdateQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return std::nullopt;
    }
    InboundUpdate out = std::move(items_.front());
    items_.pop_front();
    return out;
}

std::optional<InboundUpdate> UpdateQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    InboundUpdate out = std::move(items_.front());
    items_.pop_front();
    return out;
}

void UpdateQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool UpdateQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t UpdateQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace docdrop::messenger
