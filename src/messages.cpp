#include "protocol/messages.hpp"

namespace protocol {

Bytes encode_hello(const std::string& username) {
    Bytes payload;
    write_string(payload, username);
    return pack_message(MessageType::HELLO, payload);
}

Bytes encode_ping() {
    return pack_message(MessageType::PING);
}

Bytes encode_file_advert(const std::string& file_id, const std::string& name, int64_t size) {
    Bytes payload;
    write_string(payload, file_id);
    write_string(payload, name);
    write_int64(payload, size);
    return pack_message(MessageType::FILE_ADVERT, payload);
}

Bytes encode_get_file(const std::string& transfer_id, const std::string& file_id, int64_t offset) {
    Bytes payload;
    write_string(payload, transfer_id);
    write_string(payload, file_id);
    write_int64(payload, offset);
    return pack_message(MessageType::GET_FILE, payload);
}

Bytes encode_file_chunk(const std::string& transfer_id, int64_t offset, const Bytes& chunk) {
    Bytes payload;
    payload.reserve(4 + transfer_id.size() + 8 + 4 + chunk.size());
    write_string(payload, transfer_id);
    write_int64(payload, offset);
    write_chunk(payload, chunk);
    return pack_message(MessageType::FILE_CHUNK, payload);
}

Hello decode_hello(const Bytes& payload) {
    ByteReader reader(payload);
    Hello msg;
    msg.username = read_string(reader);
    return msg;
}

FileAdvert decode_file_advert(const Bytes& payload) {
    ByteReader reader(payload);
    FileAdvert msg;
    msg.file_id = read_string(reader);
    msg.name = read_string(reader);
    msg.size = read_int64(reader);
    return msg;
}

GetFile decode_get_file(const Bytes& payload) {
    ByteReader reader(payload);
    GetFile msg;
    msg.transfer_id = read_string(reader);
    msg.file_id = read_string(reader);
    msg.offset = read_int64(reader);
    return msg;
}

FileChunk decode_file_chunk(const Bytes& payload) {
    ByteReader reader(payload);
    FileChunk msg;
    msg.transfer_id = read_string(reader);
    msg.offset = read_int64(reader);
    msg.chunk = read_chunk(reader);
    return msg;
}

} // namespace protocol
