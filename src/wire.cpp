#include "protocol/wire.hpp"

namespace protocol {

void write_int32(Bytes& out, int32_t value) {
    int32_t le = boost::endian::native_to_little(value);
    uint8_t raw[4];
    std::memcpy(raw, &le, 4);
    out.insert(out.end(), raw, raw + 4);
}

void write_int64(Bytes& out, int64_t value) {
    int64_t le = boost::endian::native_to_little(value);
    uint8_t raw[8];
    std::memcpy(raw, &le, 8);
    out.insert(out.end(), raw, raw + 8);
}

void write_string(Bytes& out, const std::string& s) {
    if (s.size() > static_cast<std::size_t>(kMaxStringLength)) {
        throw CodecError(ErrorKind::STRING_TOO_LARGE,
                         "string too large: " + std::to_string(s.size()) + " bytes");
    }
    write_int32(out, static_cast<int32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

void write_chunk(Bytes& out, const Bytes& data) {
    if (data.size() > static_cast<std::size_t>(kMaxChunkLength)) {
        throw CodecError(ErrorKind::INVALID_LENGTH,
                         "chunk too large: " + std::to_string(data.size()) + " bytes");
    }
    write_int32(out, static_cast<int32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
}

ByteReader::ByteReader(const uint8_t* data, std::size_t size)
    : data_(data), size_(size) {}

ByteReader::ByteReader(const Bytes& bytes)
    : data_(bytes.data()), size_(bytes.size()) {}

} // namespace protocol
