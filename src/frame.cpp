#include "protocol/frame.hpp"

namespace protocol {

int32_t frame_length(std::size_t payload_size) {
    constexpr std::size_t kMaxPayload = static_cast<std::size_t>(kDefaultMaxFrameLength - kHeaderLength);
    if (payload_size > kMaxPayload) {
        throw CodecError(ErrorKind::INVALID_LENGTH,
                         "payload too large to frame: " + std::to_string(payload_size) + " bytes");
    }
    return static_cast<int32_t>(kHeaderLength + payload_size);
}

Bytes pack_message(MessageType type, const Bytes& payload) {
    int32_t length = frame_length(payload.size());
    Bytes out;
    out.reserve(kLengthPrefixSize + kHeaderLength + payload.size());
    write_int32(out, length);
    write_int32(out, static_cast<int32_t>(type));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

} // namespace protocol
