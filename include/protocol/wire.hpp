#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/endian/conversion.hpp>

#include "protocol/codec_error.hpp"
#include "protocol/limits.hpp"

namespace protocol {

using Bytes = std::vector<uint8_t>;

// Primitive encoders. All integers are little-endian two's complement.
void write_int32(Bytes& out, int32_t value);
void write_int64(Bytes& out, int64_t value);

// [int32 length][bytes]. Throws STRING_TOO_LARGE past kMaxStringLength,
// before anything is appended.
void write_string(Bytes& out, const std::string& s);

// [int32 length][bytes]. Throws INVALID_LENGTH past kMaxChunkLength.
void write_chunk(Bytes& out, const Bytes& data);

// In-memory SyncReadStream over a byte range. Reports asio's eof once the
// range is consumed, so the primitive readers treat it like a socket.
// Does not own the bytes; they must outlive the reader.
class ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t size);
    explicit ByteReader(const Bytes& bytes);

    template <typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec) {
        if (boost::asio::buffer_size(buffers) == 0) {
            ec = boost::system::error_code();
            return 0;
        }
        if (remaining() == 0) {
            ec = boost::asio::error::eof;
            return 0;
        }
        std::size_t n = boost::asio::buffer_copy(buffers, boost::asio::buffer(data_ + pos_, remaining()));
        pos_ += n;
        ec = boost::system::error_code();
        return n;
    }

    template <typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers) {
        boost::system::error_code ec;
        std::size_t n = read_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

    std::size_t remaining() const { return size_ - pos_; }
    std::size_t position() const { return pos_; }

private:
    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

namespace detail {

// Reads exactly n bytes or throws TRUNCATED_READ. Socket errors other than
// end-of-stream surface as boost::system::system_error.
template <typename SyncReadStream>
void read_exact(SyncReadStream& stream, uint8_t* dest, std::size_t n, const char* what) {
    boost::system::error_code ec;
    std::size_t got = boost::asio::read(stream, boost::asio::buffer(dest, n), ec);
    if (ec == boost::asio::error::eof || (!ec && got < n)) {
        throw CodecError(ErrorKind::TRUNCATED_READ,
                         std::string("unexpected end of stream reading ") + what + ": got " +
                             std::to_string(got) + " of " + std::to_string(n) + " bytes");
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }
}

// Fills a container of n bytes in kChunkReadStep increments, so a lying
// length field costs at most one step of memory past the bytes received.
template <typename Container, typename SyncReadStream>
Container read_sized(SyncReadStream& stream, std::size_t n, const char* what) {
    Container out;
    std::size_t filled = 0;
    while (filled < n) {
        std::size_t step = std::min(kChunkReadStep, n - filled);
        out.resize(filled + step);
        read_exact(stream, reinterpret_cast<uint8_t*>(&out[filled]), step, what);
        filled += step;
    }
    return out;
}

template <typename SyncReadStream>
int32_t read_length(SyncReadStream& stream, int32_t max, const char* what) {
    std::array<uint8_t, 4> raw;
    read_exact(stream, raw.data(), raw.size(), what);
    int32_t length;
    std::memcpy(&length, raw.data(), raw.size());
    length = boost::endian::little_to_native(length);
    if (length < 0 || length > max) {
        throw CodecError(ErrorKind::INVALID_LENGTH,
                         std::string("invalid ") + what + " length " + std::to_string(length));
    }
    return length;
}

} // namespace detail

template <typename SyncReadStream>
int32_t read_int32(SyncReadStream& stream) {
    std::array<uint8_t, 4> raw;
    detail::read_exact(stream, raw.data(), raw.size(), "int32");
    int32_t value;
    std::memcpy(&value, raw.data(), raw.size());
    return boost::endian::little_to_native(value);
}

template <typename SyncReadStream>
int64_t read_int64(SyncReadStream& stream) {
    std::array<uint8_t, 8> raw;
    detail::read_exact(stream, raw.data(), raw.size(), "int64");
    int64_t value;
    std::memcpy(&value, raw.data(), raw.size());
    return boost::endian::little_to_native(value);
}

// Exactly n raw bytes, no length prefix.
template <typename SyncReadStream>
Bytes read_bytes(SyncReadStream& stream, std::size_t n) {
    return detail::read_sized<Bytes>(stream, n, "bytes");
}

// Length < 0 or > kMaxStringLength throws INVALID_LENGTH without reading
// further. Zero length returns "" after consuming only the prefix.
template <typename SyncReadStream>
std::string read_string(SyncReadStream& stream) {
    int32_t length = detail::read_length(stream, kMaxStringLength, "string");
    if (length == 0) {
        return std::string();
    }
    return detail::read_sized<std::string>(stream, static_cast<std::size_t>(length), "string");
}

// Same shape as read_string with the kMaxChunkLength cap. A zero-length
// chunk is an empty vector, not an error.
template <typename SyncReadStream>
Bytes read_chunk(SyncReadStream& stream) {
    int32_t length = detail::read_length(stream, kMaxChunkLength, "chunk");
    if (length == 0) {
        return Bytes();
    }
    return detail::read_sized<Bytes>(stream, static_cast<std::size_t>(length), "chunk");
}

} // namespace protocol
