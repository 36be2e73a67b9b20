#ifndef SIGNALHUB_SIGNALING_HUB_HPP
#define SIGNALHUB_SIGNALING_HUB_HPP

#include <string>
#include <memory>
#include <chrono>
#include "room_directory.hpp"
#include "presence_broadcaster.hpp"
#include "message_router.hpp"
#include "../presence/presence_store.hpp"

namespace signalhub {

/**
 * Room signaling hub.
 *
 * Entry point for transports: a connection is admitted into a room, feeds
 * every inbound text frame to handleMessage() and is released when its
 * inbound side ends. Never throws for per-peer or per-room failures.
 */
class SignalingHub {
public:
    SignalingHub(RoomDirectory& directory, PresenceStore& store, std::chrono::seconds typing_ttl);

    SignalingHub(const SignalingHub&) = delete;
    SignalingHub& operator=(const SignalingHub&) = delete;

    /**
     * Join `room_id` and push the initial state to the peer:
     * userID, initiatorStatus, userCount, userList.
     * Returns false if the peer id is already a member somewhere.
     */
    bool admit(const std::shared_ptr<Peer>& peer, const std::string& room_id);

    // Decode and route one inbound frame. Malformed frames are logged and dropped.
    void handleMessage(const std::shared_ptr<Peer>& peer, const std::string& text);

    // Leave the room and re-broadcast presence. Safe to call more than once.
    void release(const std::shared_ptr<Peer>& peer);

    RoomDirectory& directory() { return directory_; }
    const RoomDirectory& directory() const { return directory_; }

private:
    RoomDirectory& directory_;
    PresenceStore& store_;
    PresenceBroadcaster presence_;
    MessageRouter router_;
};

} // namespace signalhub

#endif // SIGNALHUB_SIGNALING_HUB_HPP
