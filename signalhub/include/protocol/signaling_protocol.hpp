#ifndef SIGNALHUB_SIGNALING_PROTOCOL_HPP
#define SIGNALHUB_SIGNALING_PROTOCOL_HPP

#include <string>
#include <vector>
#include <cstddef>
#include "../utils/json_parser.hpp"

namespace signalhub {

/**
 * Room signaling wire protocol.
 *
 * Every frame is a JSON text message {"type", "room_id", "content"}; the shape
 * of content depends on the type.
 */
namespace SignalingProtocol {

    // Client -> server
    constexpr const char* READY = "ready";
    constexpr const char* OFFER = "offer";
    constexpr const char* ANSWER = "answer";
    constexpr const char* ICE_CANDIDATE = "iceCandidate";
    constexpr const char* CHAT_MESSAGE = "chatMessage";
    constexpr const char* START_MEETING = "startMeeting";
    constexpr const char* REQUEST_USER_LIST = "requestUserList";
    constexpr const char* PING = "ping";
    constexpr const char* TYPING = "typing";

    // Server -> client
    constexpr const char* USER_ID = "userID";
    constexpr const char* INITIATOR_STATUS = "initiatorStatus";
    constexpr const char* USER_COUNT = "userCount";
    constexpr const char* USER_LIST = "userList";
    constexpr const char* USER_JOINED = "userJoined";
    constexpr const char* USER_LEFT = "userLeft";
    constexpr const char* CREATE_OFFER = "createOffer";
    constexpr const char* ALL_READY = "allReady";
    constexpr const char* PONG = "pong";

    /**
     * Decoded envelope.
     * `content` is raw JSON text ("null" when absent) unless `content_is_string`,
     * in which case it is the unescaped string value. `raw` is the frame as received.
     */
    struct Envelope {
        std::string type;
        std::string room_id;
        std::string content = "null";
        bool content_is_string = false;
        std::string raw;
    };

    /**
     * Decode one text frame.
     * Returns false if the frame is not a JSON object with a non-empty string "type".
     * The room id may be spelled "room_id", "roomID" or "roomId".
     */
    bool decodeEnvelope(const std::string& text, Envelope& out);

    // Parse an object-valued content. Returns false for any other shape.
    bool parseContent(const Envelope& envelope, JsonParser::Object& out);

    std::string createUserId(const std::string& room_id, const std::string& peer_id);
    std::string createInitiatorStatus(const std::string& room_id, bool is_initiator);
    std::string createUserCount(const std::string& room_id, size_t count);
    std::string createUserList(const std::string& room_id, const std::vector<std::string>& peer_ids);
    std::string createUserJoined(const std::string& room_id, const std::string& peer_id);
    std::string createUserLeft(const std::string& room_id, const std::string& peer_id);
    std::string createStartMeeting(const std::string& room_id);
    std::string createCreateOffer(const std::string& room_id, const std::vector<std::string>& targets);
    std::string createAllReady(const std::string& room_id);
    std::string createPong(const std::string& room_id, const std::string& peer_id,
                           bool is_initiator, size_t client_count);
    std::string createTyping(const std::string& room_id, const std::string& peer_id, bool is_typing);

} // namespace SignalingProtocol

} // namespace signalhub

#endif // SIGNALHUB_SIGNALING_PROTOCOL_HPP
