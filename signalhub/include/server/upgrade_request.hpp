#ifndef SIGNALHUB_UPGRADE_REQUEST_HPP
#define SIGNALHUB_UPGRADE_REQUEST_HPP

#include <string>
#include <cstddef>

namespace signalhub {

constexpr size_t kMaxIdLength = 128;
constexpr const char* kWebSocketPath = "/ws";

// Parameters of "GET /ws?room_id=<id>[&user_id=<id>]".
struct UpgradeRequest {
    std::string room_id;
    std::string peer_id;
    bool generated_peer_id = false;
};

/**
 * Validate an upgrade target. A missing user_id is replaced with a generated id.
 * On failure returns false and sets `error`; the caller answers HTTP 400.
 */
bool parseUpgradeRequest(const std::string& target, UpgradeRequest& out, std::string& error);

} // namespace signalhub

#endif // SIGNALHUB_UPGRADE_REQUEST_HPP
