#include "../../include/hub/janitor_sweep.hpp"
#include "../../include/utils/logger.hpp"

namespace signalhub {

JanitorSweep::JanitorSweep(RoomDirectory& directory, PresenceStore& store,
                           std::chrono::seconds interval, std::chrono::seconds idle_threshold)
    : directory_(directory),
      store_(store),
      interval_(interval),
      idle_threshold_(idle_threshold) {}

JanitorSweep::~JanitorSweep() {
    stop();
}

void JanitorSweep::start() {
    if (running_.exchange(true)) return;

    worker_ = std::thread([this]() {
        Logger::getInstance().info("JanitorSweep started (interval " + std::to_string(interval_.count()) +
                                   "s, idle threshold " + std::to_string(idle_threshold_.count()) + "s)");

        std::unique_lock<std::mutex> lock(wait_mutex_);
        while (running_) {
            wake_.wait_for(lock, interval_, [this]() { return !running_; });
            if (!running_) break;

            lock.unlock();
            try {
                sweepOnce();
            } catch (const std::exception& e) {
                Logger::getInstance().warning(std::string("JanitorSweep loop error: ") + e.what());
            }
            lock.lock();
        }

        Logger::getInstance().info("JanitorSweep stopped");
    });
}

void JanitorSweep::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) return;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

size_t JanitorSweep::sweepOnce(Room::Clock::time_point now) {
    const auto threshold = idle_threshold_;
    auto should_evict = [now, threshold](const Room& room) {
        return room.empty() || room.isIdle(now, threshold);
    };

    size_t evicted = 0;
    for (const auto& candidate : directory_.snapshot()) {
        auto room = directory_.evict(candidate->id(), should_evict);
        if (!room) continue;

        const size_t remaining = room->size();
        room->dropAll();
        evicted++;
        Logger::getInstance().info("Room evicted: " + room->id() +
                                   (remaining > 0 ? " (idle, dropped " + std::to_string(remaining) + " peers)"
                                                  : " (empty)"));
    }

    const size_t expired = store_.purgeExpired();
    if (expired > 0) {
        Logger::getInstance().debug("Purged " + std::to_string(expired) + " expired presence keys");
    }
    return evicted;
}

} // namespace signalhub
