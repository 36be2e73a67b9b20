#include "../../include/hub/message_router.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <initializer_list>

namespace signalhub {

namespace {

// First string-valued field among `keys`, or nullptr.
const JsonParser::Field* findString(const JsonParser::Object& object,
                                    std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const JsonParser::Field* field = JsonParser::find(object, key);
        if (field != nullptr && field->is_string && !field->value.empty()) {
            return field;
        }
    }
    return nullptr;
}

} // namespace

MessageRouter::MessageRouter(const PresenceBroadcaster& presence, PresenceStore& store,
                             std::chrono::seconds typing_ttl)
    : presence_(presence), store_(store), typing_ttl_(typing_ttl) {}

bool MessageRouter::route(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const {
    namespace sp = SignalingProtocol;
    const std::string& type = envelope.type;

    if (type == sp::READY) return handleReady(room, sender, envelope);
    if (type == sp::OFFER) return handleDirected(room, sender, envelope, "sdp");
    if (type == sp::ANSWER) return handleDirected(room, sender, envelope, "sdp");
    if (type == sp::ICE_CANDIDATE) return handleDirected(room, sender, envelope, "candidate");
    if (type == sp::CHAT_MESSAGE) return handleChat(room, sender, envelope);
    if (type == sp::START_MEETING) return handleStartMeeting(room, sender);
    if (type == sp::REQUEST_USER_LIST) return handleRequestUserList(room, sender);
    if (type == sp::PING) return handlePing(room, sender);
    if (type == sp::TYPING) return handleTyping(room, sender, envelope);

    Logger::getInstance().warning("Unknown message type '" + type + "' from " + sender.id() +
                                  " in room " + room.id());
    return false;
}

std::vector<std::string> MessageRouter::offerTargets(const std::vector<std::string>& sorted_ids,
                                                     const std::string& peer_id) {
    auto first = std::upper_bound(sorted_ids.begin(), sorted_ids.end(), peer_id);
    return std::vector<std::string>(first, sorted_ids.end());
}

bool MessageRouter::handleReady(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const {
    // No content means ready; {"status": "..."} or a boolean says which way.
    bool ready = true;
    JsonParser::Object content;
    if (SignalingProtocol::parseContent(envelope, content)) {
        if (const JsonParser::Field* status = JsonParser::find(content, "status")) {
            ready = status->is_string && status->value == "ready";
        }
    } else if (envelope.content_is_string || envelope.content != "null") {
        const JsonParser::Field field{envelope.content, envelope.content_is_string};
        if (!JsonParser::asBool(field, ready)) {
            Logger::getInstance().warning("Malformed ready content from " + sender.id());
            return false;
        }
    }

    if (!room.setReady(sender.id(), ready)) {
        return false;
    }
    Logger::getInstance().debug("Peer " + sender.id() + (ready ? " ready" : " not ready") +
                                " in room " + room.id());
    presence_.publishReadiness(room);
    return true;
}

bool MessageRouter::handleDirected(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope,
                                   const char* payload_key) const {
    JsonParser::Object content;
    if (!SignalingProtocol::parseContent(envelope, content)) {
        Logger::getInstance().warning("Dropping " + envelope.type + " from " + sender.id() +
                                      ": content is not an object");
        return false;
    }

    const JsonParser::Field* from = findString(content, {"fromPeerID", "fromPeerId"});
    const JsonParser::Field* target = findString(content, {"targetPeerID", "targetPeerId", "targetPeer"});
    const JsonParser::Field* payload = JsonParser::find(content, payload_key);
    if (from == nullptr || target == nullptr || payload == nullptr || payload->value == "null") {
        Logger::getInstance().warning("Dropping " + envelope.type + " from " + sender.id() +
                                      ": missing fromPeerID, targetPeerID or " + payload_key);
        return false;
    }
    if (from->value != sender.id()) {
        Logger::getInstance().warning("Dropping " + envelope.type + " from " + sender.id() +
                                      ": fromPeerID mismatch (" + from->value + ")");
        return false;
    }
    if (target->value == sender.id()) {
        Logger::getInstance().warning("Dropping " + envelope.type + " from " + sender.id() + ": self target");
        return false;
    }

    auto peer = room.findPeer(target->value);
    if (!peer) {
        Logger::getInstance().warning("Dropping " + envelope.type + " from " + sender.id() +
                                      ": target " + target->value + " not in room " + room.id());
        return false;
    }

    Logger::getInstance().debug("Routing " + envelope.type + " " + sender.id() + " -> " + target->value);
    return peer->send(envelope.raw);
}

bool MessageRouter::handleChat(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const {
    room.broadcast(envelope.raw, sender.id());
    return true;
}

bool MessageRouter::handleStartMeeting(Room& room, Peer& sender) const {
    room.markMeetingStarted();
    Logger::getInstance().info("Meeting started in room " + room.id() + " by " + sender.id());

    room.broadcast(SignalingProtocol::createStartMeeting(room.id()));

    const auto members = room.peers();
    std::vector<std::string> ids;
    ids.reserve(members.size());
    for (const auto& member : members) {
        ids.push_back(member->id());
    }
    std::sort(ids.begin(), ids.end());

    for (const auto& member : members) {
        member->send(SignalingProtocol::createCreateOffer(room.id(), offerTargets(ids, member->id())));
    }

    // Readiness may already be complete.
    presence_.announceAllReady(room);
    return true;
}

bool MessageRouter::handleRequestUserList(Room& room, Peer& sender) const {
    presence_.sendUserList(room, sender);
    return true;
}

bool MessageRouter::handlePing(Room& room, Peer& sender) const {
    return sender.send(SignalingProtocol::createPong(room.id(), sender.id(),
                                                     room.isInitiator(sender.id()), room.size()));
}

bool MessageRouter::handleTyping(Room& room, Peer& sender, const SignalingProtocol::Envelope& envelope) const {
    JsonParser::Object content;
    bool is_typing = false;
    const JsonParser::Field* flag = nullptr;
    if (SignalingProtocol::parseContent(envelope, content)) {
        flag = JsonParser::find(content, "isTyping");
    }
    if (flag == nullptr || !JsonParser::asBool(*flag, is_typing)) {
        Logger::getInstance().warning("Dropping typing from " + sender.id() + ": missing isTyping");
        return false;
    }

    try {
        const bool stored = is_typing
            ? store_.setTyping(room.id(), sender.id(), typing_ttl_)
            : store_.clearTyping(room.id(), sender.id());
        if (!stored) {
            Logger::getInstance().warning("Presence store rejected typing update for " + sender.id());
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Presence store error: " + std::string(e.what()));
    }

    room.broadcast(SignalingProtocol::createTyping(room.id(), sender.id(), is_typing), sender.id());
    return true;
}

} // namespace signalhub
