#include "../../include/server/upgrade_request.hpp"
#include "../../include/utils/url_utils.hpp"
#include "../../include/utils/id_generator.hpp"

namespace signalhub {

bool parseUpgradeRequest(const std::string& target, UpgradeRequest& out, std::string& error) {
    std::string path;
    std::string query;
    splitTarget(target, path, query);
    if (path != kWebSocketPath) {
        error = "Unknown upgrade path";
        return false;
    }

    const auto params = parseQueryString(query);
    UpgradeRequest result;

    auto room_it = params.find("room_id");
    if (room_it == params.end() || room_it->second.empty()) {
        error = "room_id is required";
        return false;
    }
    if (room_it->second.size() > kMaxIdLength) {
        error = "room_id is too long";
        return false;
    }
    result.room_id = room_it->second;

    auto user_it = params.find("user_id");
    if (user_it != params.end() && !user_it->second.empty()) {
        if (user_it->second.size() > kMaxIdLength) {
            error = "user_id is too long";
            return false;
        }
        result.peer_id = user_it->second;
    } else {
        result.peer_id = IdGenerator::generatePeerId();
        if (result.peer_id.empty()) {
            error = "Failed to generate peer id";
            return false;
        }
        result.generated_peer_id = true;
    }

    out = std::move(result);
    return true;
}

} // namespace signalhub
