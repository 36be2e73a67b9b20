#ifndef SIGNALHUB_ROOM_ERROR_HPP
#define SIGNALHUB_ROOM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace signalhub {

enum class RoomErrorCode {
    PeerAlreadyInRoom,
    RoomNotFound
};

// Lifecycle failure reported synchronously by Room and RoomDirectory.
class RoomError : public std::runtime_error {
public:
    explicit RoomError(RoomErrorCode code)
        : std::runtime_error(describe(code)), code_(code) {}

    RoomErrorCode code() const { return code_; }

    static const char* describe(RoomErrorCode code) {
        switch (code) {
            case RoomErrorCode::PeerAlreadyInRoom: return "peer already in room";
            case RoomErrorCode::RoomNotFound: return "room not found";
        }
        return "room error";
    }

private:
    RoomErrorCode code_;
};

} // namespace signalhub

#endif // SIGNALHUB_ROOM_ERROR_HPP
