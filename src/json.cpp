#include "protocol/json.hpp"

namespace protocol {

void to_json(nlohmann::json& j, const FileChunk& msg) {
    j = nlohmann::json{
        {"transfer_id", msg.transfer_id},
        {"offset", msg.offset},
        {"chunk_size", msg.chunk.size()}
    };
}

nlohmann::json frame_to_json(const Frame& frame) {
    nlohmann::json j{
        {"type", to_string(frame.type)},
        {"code", static_cast<int32_t>(frame.type)},
        {"payload_size", frame.payload.size()}
    };

    try {
        switch (frame.type) {
            case MessageType::HELLO:
                j["message"] = decode_hello(frame.payload);
                break;
            case MessageType::PING:
                j["message"] = nlohmann::json::object();
                break;
            case MessageType::FILE_ADVERT:
                j["message"] = decode_file_advert(frame.payload);
                break;
            case MessageType::GET_FILE:
                j["message"] = decode_get_file(frame.payload);
                break;
            case MessageType::FILE_CHUNK:
                j["message"] = decode_file_chunk(frame.payload);
                break;
            default:
                break;
        }
    } catch (const CodecError& e) {
        j["error"] = e.what();
        j["error_kind"] = to_string(e.kind());
    }
    return j;
}

} // namespace protocol
