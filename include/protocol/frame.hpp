#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "protocol/message_type.hpp"
#include "protocol/wire.hpp"

namespace protocol {

// On the wire: [int32 length][int32 type][payload]. length counts the type
// tag and the payload, never itself, so it is at least 4.
constexpr int32_t kHeaderLength = 4;
constexpr std::size_t kLengthPrefixSize = 4;

struct Frame {
    MessageType type;
    Bytes payload;
};

// Wire length for a payload of this size. The field is an int32, so a
// payload over INT32_MAX - 4 bytes cannot be framed: INVALID_LENGTH.
int32_t frame_length(std::size_t payload_size);

// Throws only when frame_length does.
Bytes pack_message(MessageType type, const Bytes& payload = Bytes());

namespace detail {

template <typename SyncReadStream>
Frame read_frame_body(SyncReadStream& stream, int32_t length, int32_t max_frame_length) {
    if (length < kHeaderLength) {
        throw CodecError(ErrorKind::INVALID_LENGTH, "invalid message length: " + std::to_string(length));
    }
    if (length > max_frame_length) {
        throw CodecError(ErrorKind::INVALID_LENGTH,
                         "message length " + std::to_string(length) + " exceeds limit " +
                             std::to_string(max_frame_length));
    }

    Frame frame;
    frame.type = static_cast<MessageType>(read_int32(stream));
    frame.payload = read_bytes(stream, static_cast<std::size_t>(length - kHeaderLength));
    return frame;
}

} // namespace detail

// Reads one frame. Throws CodecError:
// - TRUNCATED_READ if the stream ends anywhere inside the frame
// - INVALID_LENGTH if length < 4 or length > max_frame_length
// Unknown type tags are returned as-is. An empty payload is an empty vector.
template <typename SyncReadStream>
Frame read_message(SyncReadStream& stream, int32_t max_frame_length = kDefaultMaxFrameLength) {
    int32_t length = read_int32(stream);
    return detail::read_frame_body(stream, length, max_frame_length);
}

// Same as read_message, except that a stream ending exactly on a frame
// boundary returns std::nullopt. Ending anywhere else is still TRUNCATED_READ.
template <typename SyncReadStream>
std::optional<Frame> read_next_message(SyncReadStream& stream,
                                       int32_t max_frame_length = kDefaultMaxFrameLength) {
    std::array<uint8_t, kLengthPrefixSize> raw;
    boost::system::error_code ec;
    std::size_t got = boost::asio::read(stream, boost::asio::buffer(raw), ec);
    if (ec == boost::asio::error::eof && got == 0) {
        return std::nullopt;
    }
    if (ec == boost::asio::error::eof) {
        throw CodecError(ErrorKind::TRUNCATED_READ,
                         "unexpected end of stream reading int32: got " + std::to_string(got) +
                             " of " + std::to_string(raw.size()) + " bytes");
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }
    int32_t length;
    std::memcpy(&length, raw.data(), raw.size());
    length = boost::endian::little_to_native(length);
    return detail::read_frame_body(stream, length, max_frame_length);
}

} // namespace protocol
