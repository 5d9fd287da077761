#pragma once

#include <cstdint>
#include <string>

namespace protocol {

enum class MessageType : int32_t {
    // Control / discovery
    HELLO = 1,
    ROOMS_LIST = 10,
    JOIN_ROOM = 11,
    ROOM_MEMBERS = 12,

    // Files / transfers
    FILE_LIST = 20,
    FILE_ADVERT = 21,
    GET_FILE = 30,
    FILE_CHUNK = 31,
    TRANSFER_INIT = 50,

    CHAT = 40,

    PING = 99
};

// Protocol-level failure codes a peer may signal. Not a message type.
enum class ErrorCode : int32_t {
    NONE = 0,
    INVALID = 1,
    NOT_FOUND = 2,
    PERMISSION = 3,
    INTERNAL = 10
};

// "HELLO", "FILE_CHUNK", ... or "Msg(<n>)" for codes with no name.
std::string to_string(MessageType type);

// "no error", "not found", ... or "ErrorCode(<n>)" for unknown codes.
std::string to_string(ErrorCode code);

// True for the types that have an encoder/decoder pair. The others travel
// as opaque payloads.
bool has_structured_payload(MessageType type);

} // namespace protocol
