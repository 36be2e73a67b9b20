#include "../../include/hub/signaling_hub.hpp"
#include "../../include/protocol/signaling_protocol.hpp"
#include "../../include/utils/logger.hpp"

namespace signalhub {

SignalingHub::SignalingHub(RoomDirectory& directory, PresenceStore& store, std::chrono::seconds typing_ttl)
    : directory_(directory),
      store_(store),
      router_(presence_, store_, typing_ttl) {}

bool SignalingHub::admit(const std::shared_ptr<Peer>& peer, const std::string& room_id) {
    RoomDirectory::JoinResult joined;
    try {
        // userID and initiatorStatus are queued before any room broadcast can reach the peer.
        joined = directory_.join(room_id, peer, [&peer, &room_id](bool is_initiator) {
            peer->send(SignalingProtocol::createUserId(room_id, peer->id()));
            peer->send(SignalingProtocol::createInitiatorStatus(room_id, is_initiator));
        });
    } catch (const RoomError& e) {
        Logger::getInstance().warning("Refusing peer " + peer->id() + " in room " + room_id + ": " + e.what());
        return false;
    }

    Room& room = *joined.room;
    Logger::getInstance().info("Peer " + peer->id() + " joined room " + room_id +
                               (joined.is_initiator ? " as initiator" : "") +
                               " (members: " + std::to_string(room.size()) + ")");

    presence_.announceJoin(room, peer->id());
    presence_.publishMembership(room, peer);
    return true;
}

void SignalingHub::handleMessage(const std::shared_ptr<Peer>& peer, const std::string& text) {
    SignalingProtocol::Envelope envelope;
    if (!SignalingProtocol::decodeEnvelope(text, envelope)) {
        Logger::getInstance().warning("Malformed message from " + peer->id() + ", dropped");
        return;
    }

    auto room = peer->room();
    if (!room) {
        Logger::getInstance().debug("Message from " + peer->id() + " outside any room, dropped");
        return;
    }
    if (!envelope.room_id.empty() && envelope.room_id != room->id()) {
        Logger::getInstance().warning("Message from " + peer->id() + " names room " + envelope.room_id +
                                      " but peer is in " + room->id() + ", dropped");
        return;
    }

    room->touch();
    router_.route(*room, *peer, envelope);
}

void SignalingHub::release(const std::shared_ptr<Peer>& peer) {
    auto room = directory_.leave(peer);
    if (!room) {
        return;
    }

    try {
        store_.clearTyping(room->id(), peer->id());
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Presence store error: " + std::string(e.what()));
    }

    Logger::getInstance().info("Peer " + peer->id() + " left room " + room->id() +
                               " (members: " + std::to_string(room->size()) + ")");
    presence_.announceLeave(*room, peer->id());
    presence_.publishMembership(*room);
}

} // namespace signalhub
