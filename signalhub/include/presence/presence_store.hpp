#ifndef SIGNALHUB_PRESENCE_STORE_HPP
#define SIGNALHUB_PRESENCE_STORE_HPP

#include <string>
#include <vector>
#include <chrono>

namespace signalhub {

/**
 * Shared ephemeral key/value store used for typing indicators.
 * Keys are "typing:<room>:<peer>" with a per-key expiry. Failures are
 * reported as false and never affect routing.
 */
class PresenceStore {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~PresenceStore() = default;

    virtual bool setTyping(const std::string& room_id, const std::string& peer_id,
                           std::chrono::seconds ttl) = 0;
    virtual bool clearTyping(const std::string& room_id, const std::string& peer_id) = 0;

    // Peers with an unexpired typing key in the room, sorted.
    virtual std::vector<std::string> typingPeers(const std::string& room_id) = 0;

    // Drops expired keys; returns how many were removed.
    virtual size_t purgeExpired() = 0;

    static std::string typingKey(const std::string& room_id, const std::string& peer_id) {
        return "typing:" + room_id + ":" + peer_id;
    }
};

} // namespace signalhub

#endif // SIGNALHUB_PRESENCE_STORE_HPP
