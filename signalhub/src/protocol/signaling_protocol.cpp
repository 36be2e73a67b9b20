#include "../../include/protocol/signaling_protocol.hpp"
#include <sstream>

namespace signalhub {
namespace SignalingProtocol {

namespace {

std::string envelope(const char* type, const std::string& room_id, const std::string& content_json) {
    std::ostringstream oss;
    oss << "{"
        << "\"type\":\"" << type << "\","
        << "\"room_id\":" << JsonParser::quote(room_id) << ","
        << "\"content\":" << content_json
        << "}";
    return oss.str();
}

} // namespace

bool decodeEnvelope(const std::string& text, Envelope& out) {
    JsonParser::Object object;
    if (!JsonParser::parseObject(text, object)) {
        return false;
    }

    const JsonParser::Field* type = JsonParser::find(object, "type");
    if (type == nullptr || !type->is_string || type->value.empty()) {
        return false;
    }

    Envelope result;
    result.type = type->value;
    result.raw = text;

    for (const char* key : {"room_id", "roomID", "roomId"}) {
        const JsonParser::Field* room = JsonParser::find(object, key);
        if (room != nullptr && room->is_string) {
            result.room_id = room->value;
            break;
        }
    }

    if (const JsonParser::Field* content = JsonParser::find(object, "content")) {
        result.content = content->value;
        result.content_is_string = content->is_string;
    }

    out = std::move(result);
    return true;
}

bool parseContent(const Envelope& envelope, JsonParser::Object& out) {
    // A string content is accepted too: older clients JSON-encode the object into a string.
    return JsonParser::parseObject(envelope.content, out);
}

std::string createUserId(const std::string& room_id, const std::string& peer_id) {
    return envelope(USER_ID, room_id, JsonParser::quote(peer_id));
}

std::string createInitiatorStatus(const std::string& room_id, bool is_initiator) {
    return envelope(INITIATOR_STATUS, room_id, is_initiator ? "true" : "false");
}

std::string createUserCount(const std::string& room_id, size_t count) {
    return envelope(USER_COUNT, room_id, std::to_string(count));
}

std::string createUserList(const std::string& room_id, const std::vector<std::string>& peer_ids) {
    return envelope(USER_LIST, room_id, "{\"users\":" + JsonParser::stringArray(peer_ids) + "}");
}

std::string createUserJoined(const std::string& room_id, const std::string& peer_id) {
    return envelope(USER_JOINED, room_id, JsonParser::quote(peer_id));
}

std::string createUserLeft(const std::string& room_id, const std::string& peer_id) {
    return envelope(USER_LEFT, room_id, JsonParser::quote(peer_id));
}

std::string createStartMeeting(const std::string& room_id) {
    return envelope(START_MEETING, room_id, "true");
}

std::string createCreateOffer(const std::string& room_id, const std::vector<std::string>& targets) {
    return envelope(CREATE_OFFER, room_id, "{\"peers\":" + JsonParser::stringArray(targets) + "}");
}

std::string createAllReady(const std::string& room_id) {
    return envelope(ALL_READY, room_id, "true");
}

std::string createPong(const std::string& room_id, const std::string& peer_id,
                       bool is_initiator, size_t client_count) {
    std::ostringstream content;
    content << "{"
            << "\"userId\":" << JsonParser::quote(peer_id) << ","
            << "\"isInitiator\":" << (is_initiator ? "true" : "false") << ","
            << "\"clientCount\":" << client_count
            << "}";
    return envelope(PONG, room_id, content.str());
}

std::string createTyping(const std::string& room_id, const std::string& peer_id, bool is_typing) {
    std::ostringstream content;
    content << "{"
            << "\"peerID\":" << JsonParser::quote(peer_id) << ","
            << "\"isTyping\":" << (is_typing ? "true" : "false")
            << "}";
    return envelope(TYPING, room_id, content.str());
}

} // namespace SignalingProtocol
} // namespace signalhub
