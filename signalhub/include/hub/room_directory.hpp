#ifndef SIGNALHUB_ROOM_DIRECTORY_HPP
#define SIGNALHUB_ROOM_DIRECTORY_HPP

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include "room.hpp"

namespace signalhub {

/**
 * Registry of live rooms for one process.
 *
 * Constructed explicitly and handed to whoever needs it. Structural changes
 * take the directory lock; room state takes the room lock. When both are
 * held the directory lock is taken first.
 */
class RoomDirectory {
public:
    struct JoinResult {
        std::shared_ptr<Room> room;
        bool is_initiator = false;
    };

    RoomDirectory() = default;
    RoomDirectory(const RoomDirectory&) = delete;
    RoomDirectory& operator=(const RoomDirectory&) = delete;

    // Atomic lookup-or-create.
    std::shared_ptr<Room> getOrCreateRoom(const std::string& room_id);

    // Throws RoomError(RoomNotFound) for an unknown id.
    std::shared_ptr<Room> getRoom(const std::string& room_id) const;

    // nullptr for an unknown id.
    std::shared_ptr<Room> findRoom(const std::string& room_id) const;

    /**
     * Get-or-create the room and add the peer to it.
     * Throws RoomError(PeerAlreadyInRoom) if the peer id is a member of any room.
     * `on_admitted` is handed to Room::addPeer.
     */
    JoinResult join(const std::string& room_id, const std::shared_ptr<Peer>& peer,
                    const std::function<void(bool is_initiator)>& on_admitted = nullptr);

    /**
     * Remove the peer from the room it joined. Returns that room, or nullptr
     * if this peer object is not a member anywhere.
     */
    std::shared_ptr<Room> leave(const std::shared_ptr<Peer>& peer);

    /**
     * Remove the room if `predicate` holds for it under the directory lock.
     * Returns the removed room (its members are not closed here), or nullptr.
     */
    std::shared_ptr<Room> evict(const std::string& room_id,
                                const std::function<bool(const Room&)>& predicate);

    // Copy of the current rooms, never a live view.
    std::vector<std::shared_ptr<Room>> snapshot() const;

    size_t roomCount() const;
    bool containsPeer(const std::string& peer_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Room>> rooms_;
    // peer id -> room id
    std::map<std::string, std::string> peer_index_;

    std::shared_ptr<Room> getOrCreateLocked(const std::string& room_id);
};

} // namespace signalhub

#endif // SIGNALHUB_ROOM_DIRECTORY_HPP
