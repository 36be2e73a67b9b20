#include "../../include/presence/in_memory_presence_store.hpp"

namespace signalhub {

InMemoryPresenceStore::InMemoryPresenceStore()
    : now_([]() { return Clock::now(); }) {}

InMemoryPresenceStore::InMemoryPresenceStore(TimeSource now)
    : now_(std::move(now)) {}

bool InMemoryPresenceStore::setTyping(const std::string& room_id, const std::string& peer_id,
                                      std::chrono::seconds ttl) {
    const auto expiry = now_() + ttl;
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[typingKey(room_id, peer_id)] = expiry;
    return true;
}

bool InMemoryPresenceStore::clearTyping(const std::string& room_id, const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.erase(typingKey(room_id, peer_id));
    return true;
}

std::vector<std::string> InMemoryPresenceStore::typingPeers(const std::string& room_id) {
    const std::string prefix = "typing:" + room_id + ":";
    const auto now = now_();

    std::vector<std::string> peers;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = keys_.lower_bound(prefix); it != keys_.end(); ) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (it->second <= now) {
            it = keys_.erase(it);
            continue;
        }
        peers.push_back(it->first.substr(prefix.size()));
        ++it;
    }
    return peers;
}

size_t InMemoryPresenceStore::purgeExpired() {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = keys_.begin(); it != keys_.end(); ) {
        if (it->second <= now) {
            it = keys_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryPresenceStore::keyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

} // namespace signalhub
