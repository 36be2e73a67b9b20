#ifndef SIGNALHUB_MESSAGE_ROUTER_HPP
#define SIGNALHUB_MESSAGE_ROUTER_HPP

#include <string>
#include <vector>
#include <chrono>
#include "room.hpp"
#include "presence_broadcaster.hpp"
#include "../presence/presence_store.hpp"
#include "../protocol/signaling_protocol.hpp"

namespace signalhub {

/**
 * Maps a decoded message to its routing rule against the sender's room.
 * Invalid messages are logged and dropped; nothing is thrown and no error
 * frame is sent back.
 */
class MessageRouter {
public:
    MessageRouter(const PresenceBroadcaster& presence, PresenceStore& store,
                  std::chrono::seconds typing_ttl);

    // Returns false if the message was dropped.
    bool route(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const;

    /**
     * Directed offer assignment for startMeeting: each member offers to every
     * member whose id compares greater than its own (byte order).
     */
    static std::vector<std::string> offerTargets(const std::vector<std::string>& sorted_ids,
                                                 const std::string& peer_id);

private:
    const PresenceBroadcaster& presence_;
    PresenceStore& store_;
    std::chrono::seconds typing_ttl_;

    bool handleReady(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const;
    bool handleDirected(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope,
                        const char* payload_key) const;
    bool handleChat(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const;
    bool handleStartMeeting(Room& room, Peer& sender) const;
    bool handleRequestUserList(Room& room, Peer& sender) const;
    bool handlePing(Room& room, Peer& sender) const;
    bool handleTyping(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const;
};

} // namespace signalhub

#endif // SIGNALHUB_MESSAGE_ROUTER_HPP
