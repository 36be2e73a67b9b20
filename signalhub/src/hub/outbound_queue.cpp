#include "../../include/hub/outbound_queue.hpp"
#include <iterator>

namespace signalhub {

OutboundQueue::OutboundQueue(size_t capacity)
    : capacity_(capacity) {}

OutboundQueue::PushResult OutboundQueue::push(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return PushResult::Closed;
    }
    if (messages_.size() >= capacity_) {
        return PushResult::Full;
    }
    messages_.push_back(std::move(message));
    return PushResult::Queued;
}

bool OutboundQueue::tryPop(std::string& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (messages_.empty()) {
        return false;
    }
    out = std::move(messages_.front());
    messages_.pop_front();
    return true;
}

bool OutboundQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    closed_ = true;
    return true;
}

bool OutboundQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool OutboundQueue::isDrained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && messages_.empty();
}

size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::vector<std::string> OutboundQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out(std::make_move_iterator(messages_.begin()),
                                 std::make_move_iterator(messages_.end()));
    messages_.clear();
    return out;
}

} // namespace signalhub
