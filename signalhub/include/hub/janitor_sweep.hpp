#ifndef SIGNALHUB_JANITOR_SWEEP_HPP
#define SIGNALHUB_JANITOR_SWEEP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "room_directory.hpp"
#include "../presence/presence_store.hpp"

namespace signalhub {

// Background reclamation of empty or inactive rooms. The only place rooms are deleted.
class JanitorSweep {
public:
    JanitorSweep(RoomDirectory& directory, PresenceStore& store,
                 std::chrono::seconds interval, std::chrono::seconds idle_threshold);
    ~JanitorSweep();

    JanitorSweep(const JanitorSweep&) = delete;
    JanitorSweep& operator=(const JanitorSweep&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * One pass: evict every room that is empty or idle longer than the
     * threshold at `now`, force-closing its remaining members.
     * Returns the number of rooms evicted.
     */
    size_t sweepOnce(Room::Clock::time_point now = Room::Clock::now());

private:
    RoomDirectory& directory_;
    PresenceStore& store_;
    const std::chrono::seconds interval_;
    const std::chrono::seconds idle_threshold_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
};

} // namespace signalhub

#endif // SIGNALHUB_JANITOR_SWEEP_HPP
