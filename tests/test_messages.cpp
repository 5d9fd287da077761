#include "protocol/messages.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

// Message layer: per-type encoders and all-or-nothing decoders.

namespace {

// Strip the frame header and check the type tag.
bool unwrap(const protocol::Bytes& packet, protocol::MessageType expected, protocol::Bytes& payload) {
    protocol::ByteReader reader(packet);
    protocol::Frame frame = protocol::read_message(reader);
    if (frame.type != expected || reader.remaining() != 0) {
        return false;
    }
    payload = frame.payload;
    return true;
}

template <typename Fn>
bool expect_error(protocol::ErrorKind expected, Fn fn) {
    try {
        fn();
    } catch (const protocol::CodecError& e) {
        return e.kind() == expected;
    }
    return false;
}

} // namespace

int main() {
    // Test 1: HELLO
    {
        protocol::Bytes payload;
        if (!unwrap(protocol::encode_hello("alice"), protocol::MessageType::HELLO, payload)) {
            std::printf("HELLO framing test failed\n");
            return EXIT_FAILURE;
        }
        if (protocol::decode_hello(payload).username != "alice") {
            std::printf("HELLO decode test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 2: PING carries no payload
    {
        protocol::Bytes packet = protocol::encode_ping();
        protocol::Bytes payload;
        if (packet.size() != 8 || !unwrap(packet, protocol::MessageType::PING, payload) || !payload.empty()) {
            std::printf("PING test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 3: FILE_ADVERT
    {
        protocol::Bytes payload;
        if (!unwrap(protocol::encode_file_advert("id1", "a.txt", 42), protocol::MessageType::FILE_ADVERT, payload)) {
            std::printf("FILE_ADVERT framing test failed\n");
            return EXIT_FAILURE;
        }
        auto advert = protocol::decode_file_advert(payload);
        if (advert.file_id != "id1" || advert.name != "a.txt" || advert.size != 42) {
            std::printf("FILE_ADVERT decode test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: GET_FILE, including a resume offset past 4GB
    {
        protocol::Bytes payload;
        if (!unwrap(protocol::encode_get_file("tx", "f", 99), protocol::MessageType::GET_FILE, payload)) {
            std::printf("GET_FILE framing test failed\n");
            return EXIT_FAILURE;
        }
        auto get = protocol::decode_get_file(payload);
        if (get.transfer_id != "tx" || get.file_id != "f" || get.offset != 99) {
            std::printf("GET_FILE decode test failed\n");
            return EXIT_FAILURE;
        }

        unwrap(protocol::encode_get_file("tx2", "big.iso", 5000000000LL), protocol::MessageType::GET_FILE, payload);
        if (protocol::decode_get_file(payload).offset != 5000000000LL) {
            std::printf("GET_FILE large offset test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 5: FILE_CHUNK
    {
        protocol::Bytes payload;
        if (!unwrap(protocol::encode_file_chunk("tx", 7, {1, 2, 3}), protocol::MessageType::FILE_CHUNK, payload)) {
            std::printf("FILE_CHUNK framing test failed\n");
            return EXIT_FAILURE;
        }
        auto chunk = protocol::decode_file_chunk(payload);
        if (chunk.transfer_id != "tx" || chunk.offset != 7 || chunk.chunk != protocol::Bytes{1, 2, 3}) {
            std::printf("FILE_CHUNK decode test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 6: zero-length chunk decodes to an empty chunk, not an error
    {
        protocol::Bytes payload;
        unwrap(protocol::encode_file_chunk("tx", 0, protocol::Bytes()), protocol::MessageType::FILE_CHUNK, payload);
        auto chunk = protocol::decode_file_chunk(payload);
        if (chunk.transfer_id != "tx" || !chunk.chunk.empty()) {
            std::printf("Empty chunk test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 7: declared chunk length past 100MiB -> INVALID_LENGTH, with no
    // body bytes present at all
    {
        protocol::Bytes payload;
        protocol::write_string(payload, "tx");
        protocol::write_int64(payload, 0);
        protocol::write_int32(payload, protocol::kMaxChunkLength + 1);
        if (!expect_error(protocol::ErrorKind::INVALID_LENGTH, [&] { protocol::decode_file_chunk(payload); })) {
            std::printf("Chunk cap decode test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 8: negative chunk length -> INVALID_LENGTH
    {
        protocol::Bytes payload;
        protocol::write_string(payload, "tx");
        protocol::write_int64(payload, 0);
        protocol::write_int32(payload, -5);
        if (!expect_error(protocol::ErrorKind::INVALID_LENGTH, [&] { protocol::decode_file_chunk(payload); })) {
            std::printf("Negative chunk length test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 9: every truncation point of a FILE_ADVERT payload fails cleanly
    {
        protocol::Bytes payload;
        unwrap(protocol::encode_file_advert("id123", "song.mp3", 123456), protocol::MessageType::FILE_ADVERT, payload);
        for (std::size_t cut = 0; cut < payload.size(); ++cut) {
            protocol::Bytes partial(payload.begin(), payload.begin() + cut);
            if (!expect_error(protocol::ErrorKind::TRUNCATED_READ, [&] { protocol::decode_file_advert(partial); })) {
                std::printf("FILE_ADVERT truncated at %zu test failed\n", cut);
                return EXIT_FAILURE;
            }
        }
    }

    // Test 10: chunk body shorter than its declared length -> TRUNCATED_READ
    {
        protocol::Bytes payload;
        unwrap(protocol::encode_file_chunk("tx1", 512, {'a', 'b', 'c', 'd'}), protocol::MessageType::FILE_CHUNK, payload);
        payload.pop_back();
        if (!expect_error(protocol::ErrorKind::TRUNCATED_READ, [&] { protocol::decode_file_chunk(payload); })) {
            std::printf("Short chunk body test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 11: empty HELLO payload -> TRUNCATED_READ; empty username is fine
    {
        if (!expect_error(protocol::ErrorKind::TRUNCATED_READ, [] { protocol::decode_hello(protocol::Bytes()); })) {
            std::printf("Empty HELLO payload test failed\n");
            return EXIT_FAILURE;
        }
        protocol::Bytes payload;
        unwrap(protocol::encode_hello(""), protocol::MessageType::HELLO, payload);
        if (!protocol::decode_hello(payload).username.empty()) {
            std::printf("Empty username test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 12: oversized fields are refused at encode time
    {
        const std::string huge(protocol::kMaxStringLength + 1, 'x');
        if (!expect_error(protocol::ErrorKind::STRING_TOO_LARGE, [&] { protocol::encode_hello(huge); })) {
            std::printf("Oversized HELLO encode test failed\n");
            return EXIT_FAILURE;
        }
        if (!expect_error(protocol::ErrorKind::STRING_TOO_LARGE, [&] { protocol::encode_get_file("tx", huge, 0); })) {
            std::printf("Oversized GET_FILE encode test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 13: bytes after the last field are ignored
    {
        protocol::Bytes payload;
        unwrap(protocol::encode_hello("bob"), protocol::MessageType::HELLO, payload);
        payload.push_back(0xEE);
        if (protocol::decode_hello(payload).username != "bob") {
            std::printf("Trailing bytes test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 14: FILE_CHUNK encoder enforces the 100MiB chunk cap
    {
        protocol::Bytes over(protocol::kMaxChunkLength + 1);
        if (!expect_error(protocol::ErrorKind::INVALID_LENGTH, [&] { protocol::encode_file_chunk("tx", 0, over); })) {
            std::printf("Oversized FILE_CHUNK encode test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 15: a chunk of exactly the cap encodes and decodes
    {
        protocol::Bytes payload;
        {
            protocol::Bytes at_cap(protocol::kMaxChunkLength, 0x11);
            unwrap(protocol::encode_file_chunk("tx", 3, at_cap), protocol::MessageType::FILE_CHUNK, payload);
        }
        auto chunk = protocol::decode_file_chunk(payload);
        if (chunk.offset != 3 || chunk.chunk.size() != static_cast<std::size_t>(protocol::kMaxChunkLength)) {
            std::printf("FILE_CHUNK at cap test failed\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All message tests passed\n");

    return EXIT_SUCCESS;
}
