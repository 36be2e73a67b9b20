#ifndef SIGNALHUB_PRESENCE_BROADCASTER_HPP
#define SIGNALHUB_PRESENCE_BROADCASTER_HPP

#include <string>
#include <memory>
#include "room.hpp"

namespace signalhub {

/**
 * Emits room-wide summaries.
 * userCount goes out only when it differs from the last broadcast value;
 * userList is never suppressed.
 */
class PresenceBroadcaster {
public:
    /**
     * Returns true if a userCount was broadcast. When the count is unchanged,
     * `joiner` alone receives it.
     */
    bool broadcastUserCount(Room& room, const std::shared_ptr<Peer>& joiner = nullptr) const;

    void broadcastUserList(Room& room) const;
    void sendUserList(const Room& room, Peer& peer) const;

    /**
     * Re-broadcast after a join or leave. A joiner that would otherwise miss
     * the current count (count unchanged) receives it directly.
     */
    void publishMembership(Room& room, const std::shared_ptr<Peer>& joiner = nullptr) const;

    // Re-broadcast after a readiness change, followed by allReady once per meeting.
    void publishReadiness(Room& room) const;

    // Returns true if allReady was broadcast.
    bool announceAllReady(Room& room) const;

    void announceJoin(const Room& room, const std::string& peer_id) const;
    void announceLeave(const Room& room, const std::string& peer_id) const;
};

} // namespace signalhub

#endif // SIGNALHUB_PRESENCE_BROADCASTER_HPP
