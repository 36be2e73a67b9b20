#include "../../include/server/diagnostics_handler.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/url_utils.hpp"
#include <sstream>

namespace signalhub {

DiagnosticsHandler::DiagnosticsHandler(const RoomDirectory& directory)
    : directory_(directory) {}

DiagnosticsResponse DiagnosticsHandler::handle(const std::string& method, const std::string& target) const {
    std::string path;
    std::string query;
    splitTarget(target, path, query);

    if (method != "GET") {
        return error(405, "Method not allowed");
    }

    if (path == "/health") {
        DiagnosticsResponse res;
        res.content_type = "text/plain";
        res.body = "OK";
        return res;
    }
    if (path == "/debug") {
        return debug();
    }

    const auto params = parseQueryString(query);
    auto room_it = params.find("room_id");
    const std::string room_id = room_it == params.end() ? "" : room_it->second;

    if (path == "/roomStatus") return roomStatus(room_id);
    if (path == "/handshake") return handshake(room_id);
    if (path == "/initiator") return initiator(room_id);

    return error(404, "Not found");
}

DiagnosticsResponse DiagnosticsHandler::roomStatus(const std::string& room_id) const {
    auto room = directory_.findRoom(room_id);
    if (!room) return error(404, "room not found");

    DiagnosticsResponse res;
    res.body = "{\"room_id\":" + JsonParser::quote(room_id) +
               ",\"status\":\"" + (room->meetingStarted() ? "started" : "waiting") + "\"}";
    return res;
}

DiagnosticsResponse DiagnosticsHandler::handshake(const std::string& room_id) const {
    auto room = directory_.findRoom(room_id);
    if (!room) return error(404, "room not found");

    const RoomStats stats = room->stats();
    std::ostringstream oss;
    oss << "{"
        << "\"initiator\":" << (stats.initiator_id.empty() ? "false" : "true") << ","
        << "\"readyClients\":" << stats.ready_clients << ","
        << "\"totalClients\":" << stats.total_clients
        << "}";

    DiagnosticsResponse res;
    res.body = oss.str();
    return res;
}

DiagnosticsResponse DiagnosticsHandler::initiator(const std::string& room_id) const {
    auto room = directory_.findRoom(room_id);
    if (!room) return error(404, "room not found");

    DiagnosticsResponse res;
    res.body = "{\"initiatorUUID\":" + JsonParser::quote(room->initiatorId()) + "}";
    return res;
}

DiagnosticsResponse DiagnosticsHandler::debug() const {
    const auto now = Room::Clock::now();
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& room : directory_.snapshot()) {
        const RoomStats stats = room->stats(now);
        if (!first) oss << ",";
        first = false;
        oss << JsonParser::quote(room->id()) << ":{"
            << "\"totalClients\":" << stats.total_clients << ","
            << "\"readyClients\":" << stats.ready_clients << ","
            << "\"hasInitiator\":" << (stats.initiator_id.empty() ? "false" : "true") << ","
            << "\"meetingStarted\":" << (stats.meeting_started ? "true" : "false") << ","
            << "\"idleSeconds\":" << stats.idle_seconds
            << "}";
    }
    oss << "}";

    DiagnosticsResponse res;
    res.body = oss.str();
    return res;
}

DiagnosticsResponse DiagnosticsHandler::error(unsigned int status, const std::string& message) {
    DiagnosticsResponse res;
    res.status = status;
    res.body = JsonParser::createErrorResponse(message);
    return res;
}

} // namespace signalhub
