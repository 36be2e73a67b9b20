#include "../../include/hub/room_directory.hpp"
#include "../../include/utils/logger.hpp"

namespace signalhub {

std::shared_ptr<Room> RoomDirectory::getOrCreateLocked(const std::string& room_id) {
    auto it = rooms_.find(room_id);
    if (it != rooms_.end()) {
        return it->second;
    }
    auto room = std::make_shared<Room>(room_id);
    rooms_.emplace(room_id, room);
    Logger::getInstance().info("Room created: " + room_id +
                               " (total: " + std::to_string(rooms_.size()) + ")");
    return room;
}

std::shared_ptr<Room> RoomDirectory::getOrCreateRoom(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return getOrCreateLocked(room_id);
}

std::shared_ptr<Room> RoomDirectory::getRoom(const std::string& room_id) const {
    auto room = findRoom(room_id);
    if (!room) {
        throw RoomError(RoomErrorCode::RoomNotFound);
    }
    return room;
}

std::shared_ptr<Room> RoomDirectory::findRoom(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? nullptr : it->second;
}

RoomDirectory::JoinResult RoomDirectory::join(const std::string& room_id,
                                              const std::shared_ptr<Peer>& peer,
                                              const std::function<void(bool is_initiator)>& on_admitted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (peer_index_.count(peer->id()) > 0) {
        throw RoomError(RoomErrorCode::PeerAlreadyInRoom);
    }

    JoinResult result;
    result.room = getOrCreateLocked(room_id);
    result.is_initiator = result.room->addPeer(peer, on_admitted);
    peer_index_.emplace(peer->id(), room_id);
    peer->attachRoom(result.room);
    return result;
}

std::shared_ptr<Room> RoomDirectory::leave(const std::shared_ptr<Peer>& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = peer_index_.find(peer->id());
    if (index_it == peer_index_.end()) {
        return nullptr;
    }

    auto room_it = rooms_.find(index_it->second);
    if (room_it == rooms_.end()) {
        peer_index_.erase(index_it);
        return nullptr;
    }

    // A refused duplicate shares the id but is not the member.
    auto room = room_it->second;
    if (room->findPeer(peer->id()) != peer) {
        return nullptr;
    }

    room->removePeer(peer->id());
    peer_index_.erase(index_it);
    peer->detachRoom();
    return room;
}

std::shared_ptr<Room> RoomDirectory::evict(const std::string& room_id,
                                           const std::function<bool(const Room&)>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end() || !predicate(*it->second)) {
        return nullptr;
    }

    auto room = it->second;
    for (const auto& peer_id : room->peerIds()) {
        auto index_it = peer_index_.find(peer_id);
        if (index_it != peer_index_.end() && index_it->second == room_id) {
            peer_index_.erase(index_it);
        }
    }
    rooms_.erase(it);
    return room;
}

std::vector<std::shared_ptr<Room>> RoomDirectory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Room>> out;
    out.reserve(rooms_.size());
    for (const auto& entry : rooms_) {
        out.push_back(entry.second);
    }
    return out;
}

size_t RoomDirectory::roomCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

bool RoomDirectory::containsPeer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_index_.count(peer_id) > 0;
}

} // namespace signalhub
