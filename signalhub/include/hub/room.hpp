#ifndef SIGNALHUB_ROOM_HPP
#define SIGNALHUB_ROOM_HPP

#include <string>
#include <map>
#include <set>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include "peer.hpp"
#include "room_error.hpp"

namespace signalhub {

struct RoomStats {
    size_t total_clients = 0;
    size_t ready_clients = 0;
    std::string initiator_id;
    bool meeting_started = false;
    long long idle_seconds = 0;
};

/**
 * In-memory room: members, initiator election, readiness and activity.
 * All state is guarded by the room's own lock. Room-wide frames are enqueued
 * under that lock too, so every member sees them in the same order.
 */
class Room {
public:
    using Clock = std::chrono::steady_clock;

    explicit Room(std::string id);

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    const std::string& id() const { return id_; }

    /**
     * Add a member. The first member added while no initiator is set becomes
     * the initiator. Throws RoomError(PeerAlreadyInRoom) if the id is present.
     * Returns whether the peer is the initiator.
     *
     * `on_admitted` runs under the room lock with the initiator result, before
     * the peer becomes visible to broadcasts.
     */
    bool addPeer(const std::shared_ptr<Peer>& peer,
                 const std::function<void(bool is_initiator)>& on_admitted = nullptr);

    /**
     * Remove a member, its readiness and, if it was the initiator, the
     * initiator slot. No other member is promoted.
     * Returns false if the id is not a member.
     */
    bool removePeer(const std::string& peer_id);

    // Returns false if the id is not a member.
    bool setReady(const std::string& peer_id, bool ready);

    std::shared_ptr<Peer> findPeer(const std::string& peer_id) const;
    std::vector<std::shared_ptr<Peer>> peers() const;
    std::vector<std::string> peerIds() const;
    size_t size() const;
    bool empty() const;

    std::string initiatorId() const;
    bool isInitiator(const std::string& peer_id) const;
    size_t readyCount() const;

    void touch(Clock::time_point now = Clock::now());
    Clock::time_point lastActivity() const;
    bool isIdle(Clock::time_point now, std::chrono::seconds threshold) const;

    size_t lastBroadcastUserCount() const;

    /**
     * Broadcast userCount if the member count changed since the last one.
     * Otherwise `joiner`, if given, receives the current count alone.
     * Returns true if the count was broadcast.
     */
    bool broadcastUserCountIfChanged(const std::shared_ptr<Peer>& joiner = nullptr);

    void broadcastUserList() const;

    void markMeetingStarted();
    bool meetingStarted() const;

    // True exactly once: meeting started, at least one member, every member ready.
    bool claimAllReadyAnnouncement();

    RoomStats stats(Clock::time_point now = Clock::now()) const;

    // Enqueue on every member except `exclude_peer_id`.
    void broadcast(const std::string& message, const std::string& exclude_peer_id = "") const;

    void closeAll();

    // Forced close of every member; queued frames are discarded.
    void dropAll();

private:
    const std::string id_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Peer>> peers_;
    std::string initiator_id_;
    std::set<std::string> ready_;
    Clock::time_point last_activity_;
    size_t last_broadcast_user_count_ = 0;
    bool meeting_started_ = false;
    bool all_ready_announced_ = false;
};

} // namespace signalhub

#endif // SIGNALHUB_ROOM_HPP
