#ifndef SIGNALHUB_DIAGNOSTICS_HANDLER_HPP
#define SIGNALHUB_DIAGNOSTICS_HANDLER_HPP

#include <string>
#include "../hub/room_directory.hpp"

namespace signalhub {

struct DiagnosticsResponse {
    unsigned int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

/**
 * Read-only HTTP surface over the room directory:
 * /health, /roomStatus, /handshake, /initiator and /debug.
 */
class DiagnosticsHandler {
public:
    explicit DiagnosticsHandler(const RoomDirectory& directory);

    DiagnosticsResponse handle(const std::string& method, const std::string& target) const;

private:
    const RoomDirectory& directory_;

    DiagnosticsResponse roomStatus(const std::string& room_id) const;
    DiagnosticsResponse handshake(const std::string& room_id) const;
    DiagnosticsResponse initiator(const std::string& room_id) const;
    DiagnosticsResponse debug() const;

    static DiagnosticsResponse error(unsigned int status, const std::string& message);
};

} // namespace signalhub

#endif // SIGNALHUB_DIAGNOSTICS_HANDLER_HPP
