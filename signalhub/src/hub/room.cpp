#include "../../include/hub/room.hpp"
#include "../../include/protocol/signaling_protocol.hpp"

namespace signalhub {

Room::Room(std::string id)
    : id_(std::move(id)), last_activity_(Clock::now()) {}

bool Room::addPeer(const std::shared_ptr<Peer>& peer,
                   const std::function<void(bool is_initiator)>& on_admitted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (peers_.count(peer->id()) > 0) {
        throw RoomError(RoomErrorCode::PeerAlreadyInRoom);
    }

    const bool is_initiator = initiator_id_.empty();
    if (on_admitted) {
        on_admitted(is_initiator);
    }

    peers_.emplace(peer->id(), peer);
    last_activity_ = Clock::now();
    if (is_initiator) {
        initiator_id_ = peer->id();
    }
    return is_initiator;
}

bool Room::removePeer(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (peers_.erase(peer_id) == 0) {
        return false;
    }
    ready_.erase(peer_id);
    if (initiator_id_ == peer_id) {
        initiator_id_.clear();
    }
    last_activity_ = Clock::now();
    return true;
}

bool Room::setReady(const std::string& peer_id, bool ready) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (peers_.count(peer_id) == 0) {
        return false;
    }
    if (ready) {
        ready_.insert(peer_id);
    } else {
        ready_.erase(peer_id);
    }
    return true;
}

std::shared_ptr<Peer> Room::findPeer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    return it == peers_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Peer>> Room::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Peer>> out;
    out.reserve(peers_.size());
    for (const auto& entry : peers_) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<std::string> Room::peerIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(peers_.size());
    for (const auto& entry : peers_) {
        out.push_back(entry.first);
    }
    return out;
}

size_t Room::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

bool Room::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.empty();
}

std::string Room::initiatorId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initiator_id_;
}

bool Room::isInitiator(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !initiator_id_.empty() && initiator_id_ == peer_id;
}

size_t Room::readyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size();
}

void Room::touch(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now > last_activity_) {
        last_activity_ = now;
    }
}

Room::Clock::time_point Room::lastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

bool Room::isIdle(Clock::time_point now, std::chrono::seconds threshold) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now - last_activity_ > threshold;
}

size_t Room::lastBroadcastUserCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_broadcast_user_count_;
}

bool Room::broadcastUserCountIfChanged(const std::shared_ptr<Peer>& joiner) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string frame = SignalingProtocol::createUserCount(id_, peers_.size());
    if (peers_.size() == last_broadcast_user_count_) {
        if (joiner && peers_.count(joiner->id()) > 0) {
            joiner->send(frame);
        }
        return false;
    }

    last_broadcast_user_count_ = peers_.size();
    for (const auto& entry : peers_) {
        entry.second->send(frame);
    }
    return true;
}

void Room::broadcastUserList() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(peers_.size());
    for (const auto& entry : peers_) {
        ids.push_back(entry.first);
    }
    const std::string frame = SignalingProtocol::createUserList(id_, ids);
    for (const auto& entry : peers_) {
        entry.second->send(frame);
    }
}

void Room::markMeetingStarted() {
    std::lock_guard<std::mutex> lock(mutex_);
    meeting_started_ = true;
}

bool Room::meetingStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return meeting_started_;
}

bool Room::claimAllReadyAnnouncement() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!meeting_started_ || all_ready_announced_ || peers_.empty()) {
        return false;
    }
    if (ready_.size() != peers_.size()) {
        return false;
    }
    all_ready_announced_ = true;
    return true;
}

RoomStats Room::stats(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    RoomStats stats;
    stats.total_clients = peers_.size();
    stats.ready_clients = ready_.size();
    stats.initiator_id = initiator_id_;
    stats.meeting_started = meeting_started_;
    stats.idle_seconds = now > last_activity_
        ? std::chrono::duration_cast<std::chrono::seconds>(now - last_activity_).count()
        : 0;
    return stats;
}

void Room::broadcast(const std::string& message, const std::string& exclude_peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : peers_) {
        if (entry.first == exclude_peer_id) continue;
        entry.second->send(message);
    }
}

void Room::closeAll() {
    for (const auto& peer : peers()) {
        peer->close();
    }
}

void Room::dropAll() {
    for (const auto& peer : peers()) {
        peer->drop();
    }
}

} // namespace signalhub
