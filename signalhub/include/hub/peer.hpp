#ifndef SIGNALHUB_PEER_HPP
#define SIGNALHUB_PEER_HPP

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include "outbound_queue.hpp"

namespace signalhub {

class Room;

/**
 * One room member as seen by the hub.
 *
 * Owns the member's outbound queue. The transport that actually writes the
 * queue to a socket derives from Peer and reacts through the protected hooks.
 */
class Peer : public std::enable_shared_from_this<Peer> {
public:
    Peer(std::string id, size_t queue_capacity);
    virtual ~Peer() = default;

    Peer(const Peer&) = delete;
    Peer& operator=(const Peer&) = delete;

    const std::string& id() const { return id_; }

    /**
     * Enqueue one frame without blocking.
     * A full queue drops the peer: the queue is closed and the transport aborted.
     * Returns false if the frame was not queued.
     */
    bool send(const std::string& message);

    // Cooperative close: no new frames are accepted, queued frames are still flushed.
    void close();

    // Forced close after a capacity failure.
    void drop();

    bool isClosed() const { return queue_.isClosed(); }
    bool wasDropped() const { return dropped_; }

    OutboundQueue& queue() { return queue_; }
    const OutboundQueue& queue() const { return queue_; }

    std::shared_ptr<Room> room() const;
    void attachRoom(const std::shared_ptr<Room>& room);
    void detachRoom();

protected:
    virtual void onEnqueued() {}
    virtual void onClosed() {}
    virtual void onDropped() {}

private:
    const std::string id_;
    OutboundQueue queue_;
    std::atomic<bool> dropped_{false};

    mutable std::mutex room_mutex_;
    std::weak_ptr<Room> room_;
};

} // namespace signalhub

#endif // SIGNALHUB_PEER_HPP
