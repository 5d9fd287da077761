#pragma once

#include <cstdint>
#include <string>

#include "protocol/frame.hpp"

namespace protocol {

// Handshake identity.
struct Hello {
    std::string username;
};

// Advertises one file a peer is willing to serve.
struct FileAdvert {
    std::string file_id;
    std::string name;
    int64_t size = 0;
};

// transfer_id is chosen by the requester and echoed on every FILE_CHUNK for
// this request. offset > 0 resumes a partial transfer.
struct GetFile {
    std::string transfer_id;
    std::string file_id;
    int64_t offset = 0;
};

struct FileChunk {
    std::string transfer_id;
    int64_t offset = 0;
    Bytes chunk;
};

// Encoders return a complete frame, ready to write to the socket.
// Strings past kMaxStringLength throw STRING_TOO_LARGE, chunks past
// kMaxChunkLength throw INVALID_LENGTH.
Bytes encode_hello(const std::string& username);
Bytes encode_ping();
Bytes encode_file_advert(const std::string& file_id, const std::string& name, int64_t size);
Bytes encode_get_file(const std::string& transfer_id, const std::string& file_id, int64_t offset);
Bytes encode_file_chunk(const std::string& transfer_id, int64_t offset, const Bytes& chunk);

// Decoders take the frame payload (no length, no type tag) and either return
// every field or throw the first CodecError hit. Bytes after the last field
// are ignored.
Hello decode_hello(const Bytes& payload);
FileAdvert decode_file_advert(const Bytes& payload);
GetFile decode_get_file(const Bytes& payload);
FileChunk decode_file_chunk(const Bytes& payload);

} // namespace protocol
