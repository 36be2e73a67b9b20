#ifndef SIGNALHUB_OUTBOUND_QUEUE_HPP
#define SIGNALHUB_OUTBOUND_QUEUE_HPP

#include <string>
#include <deque>
#include <vector>
#include <mutex>
#include <cstddef>

namespace signalhub {

/**
 * Bounded FIFO of encoded frames waiting to be written to one peer.
 * Producers never block: push() reports Full instead of waiting.
 */
class OutboundQueue {
public:
    enum class PushResult {
        Queued,
        Full,
        Closed
    };

    explicit OutboundQueue(size_t capacity);

    PushResult push(std::string message);
    bool tryPop(std::string& out);

    // Returns false if the queue was already closed.
    bool close();
    bool isClosed() const;

    // Closed and nothing left to write.
    bool isDrained() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

    // Removes and returns everything queued.
    std::vector<std::string> drain();

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> messages_;
    bool closed_ = false;
};

} // namespace signalhub

#endif // SIGNALHUB_OUTBOUND_QUEUE_HPP
