#include "protocol/message_type.hpp"

namespace protocol {

namespace {

struct TypeName {
    MessageType type;
    const char* name;
};

struct CodeName {
    ErrorCode code;
    const char* text;
};

const TypeName kTypeNames[] = {
    {MessageType::HELLO, "HELLO"},
    {MessageType::ROOMS_LIST, "ROOMS_LIST"},
    {MessageType::JOIN_ROOM, "JOIN_ROOM"},
    {MessageType::ROOM_MEMBERS, "ROOM_MEMBERS"},
    {MessageType::FILE_LIST, "FILE_LIST"},
    {MessageType::FILE_ADVERT, "FILE_ADVERT"},
    {MessageType::GET_FILE, "GET_FILE"},
    {MessageType::FILE_CHUNK, "FILE_CHUNK"},
    {MessageType::TRANSFER_INIT, "TRANSFER_INIT"},
    {MessageType::CHAT, "CHAT"},
    {MessageType::PING, "PING"},
};

const CodeName kCodeNames[] = {
    {ErrorCode::NONE, "no error"},
    {ErrorCode::INVALID, "invalid request"},
    {ErrorCode::NOT_FOUND, "not found"},
    {ErrorCode::PERMISSION, "permission denied"},
    {ErrorCode::INTERNAL, "internal error"},
};

} // namespace

std::string to_string(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "Msg(" + std::to_string(static_cast<int32_t>(type)) + ")";
}

std::string to_string(ErrorCode code) {
    for (const auto& entry : kCodeNames) {
        if (entry.code == code) {
            return entry.text;
        }
    }
    return "ErrorCode(" + std::to_string(static_cast<int32_t>(code)) + ")";
}

bool has_structured_payload(MessageType type) {
    switch (type) {
        case MessageType::HELLO:
        case MessageType::PING:
        case MessageType::FILE_ADVERT:
        case MessageType::GET_FILE:
        case MessageType::FILE_CHUNK:
            return true;
        default:
            return false;
    }
}

} // namespace protocol
