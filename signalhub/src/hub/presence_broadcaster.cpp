#include "../../include/hub/presence_broadcaster.hpp"
#include "../../include/protocol/signaling_protocol.hpp"
#include "../../include/utils/logger.hpp"

namespace signalhub {

bool PresenceBroadcaster::broadcastUserCount(Room& room, const std::shared_ptr<Peer>& joiner) const {
    if (!room.broadcastUserCountIfChanged(joiner)) {
        return false;
    }
    Logger::getInstance().debug("Broadcast user count " + std::to_string(room.lastBroadcastUserCount()) +
                                " for room " + room.id());
    return true;
}

void PresenceBroadcaster::broadcastUserList(Room& room) const {
    room.broadcastUserList();
}

void PresenceBroadcaster::sendUserList(const Room& room, Peer& peer) const {
    peer.send(SignalingProtocol::createUserList(room.id(), room.peerIds()));
}

void PresenceBroadcaster::publishMembership(Room& room, const std::shared_ptr<Peer>& joiner) const {
    broadcastUserCount(room, joiner);
    broadcastUserList(room);
}

void PresenceBroadcaster::publishReadiness(Room& room) const {
    broadcastUserCount(room);
    announceAllReady(room);
}

bool PresenceBroadcaster::announceAllReady(Room& room) const {
    if (!room.claimAllReadyAnnouncement()) {
        return false;
    }
    Logger::getInstance().info("All peers ready in room " + room.id());
    room.broadcast(SignalingProtocol::createAllReady(room.id()));
    return true;
}

void PresenceBroadcaster::announceJoin(const Room& room, const std::string& peer_id) const {
    room.broadcast(SignalingProtocol::createUserJoined(room.id(), peer_id), peer_id);
}

void PresenceBroadcaster::announceLeave(const Room& room, const std::string& peer_id) const {
    room.broadcast(SignalingProtocol::createUserLeft(room.id(), peer_id), peer_id);
}

} // namespace signalhub
