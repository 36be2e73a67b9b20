#include "../../include/hub/peer.hpp"
#include "../../include/utils/logger.hpp"

namespace signalhub {

Peer::Peer(std::string id, size_t queue_capacity)
    : id_(std::move(id)), queue_(queue_capacity) {}

bool Peer::send(const std::string& message) {
    switch (queue_.push(message)) {
        case OutboundQueue::PushResult::Queued:
            onEnqueued();
            return true;
        case OutboundQueue::PushResult::Full:
            Logger::getInstance().warning("Outbound queue full for peer " + id_ + ", dropping connection");
            drop();
            return false;
        case OutboundQueue::PushResult::Closed:
            return false;
    }
    return false;
}

void Peer::close() {
    if (queue_.close()) {
        onClosed();
    }
}

void Peer::drop() {
    if (dropped_.exchange(true)) {
        return;
    }
    queue_.close();
    onDropped();
}

std::shared_ptr<Room> Peer::room() const {
    std::lock_guard<std::mutex> lock(room_mutex_);
    return room_.lock();
}

void Peer::attachRoom(const std::shared_ptr<Room>& room) {
    std::lock_guard<std::mutex> lock(room_mutex_);
    room_ = room;
}

void Peer::detachRoom() {
    std::lock_guard<std::mutex> lock(room_mutex_);
    room_.reset();
}

} // namespace signalhub
