#ifndef SIGNALHUB_IN_MEMORY_PRESENCE_STORE_HPP
#define SIGNALHUB_IN_MEMORY_PRESENCE_STORE_HPP

#include <map>
#include <mutex>
#include <functional>
#include "presence_store.hpp"

namespace signalhub {

// Process-local PresenceStore with lazy expiry.
class InMemoryPresenceStore : public PresenceStore {
public:
    using TimeSource = std::function<Clock::time_point()>;

    InMemoryPresenceStore();
    explicit InMemoryPresenceStore(TimeSource now);

    bool setTyping(const std::string& room_id, const std::string& peer_id,
                   std::chrono::seconds ttl) override;
    bool clearTyping(const std::string& room_id, const std::string& peer_id) override;
    std::vector<std::string> typingPeers(const std::string& room_id) override;
    size_t purgeExpired() override;

    size_t keyCount() const;

private:
    TimeSource now_;
    mutable std::mutex mutex_;
    // key -> expiry
    std::map<std::string, Clock::time_point> keys_;
};

} // namespace signalhub

#endif // SIGNALHUB_IN_MEMORY_PRESENCE_STORE_HPP
