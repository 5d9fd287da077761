#pragma once

#include <nlohmann/json.hpp>

#include "protocol/frame.hpp"
#include "protocol/messages.hpp"

namespace protocol {

// Map JSON serialization automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Hello, username)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileAdvert, file_id, name, size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(GetFile, transfer_id, file_id, offset)

// Chunk bytes are summarized by size; dumping raw file data is not useful.
void to_json(nlohmann::json& j, const FileChunk& msg);

// {"type", "code", "payload_size"} plus "message" for every type with a
// structured payload (an empty object for PING).
// A payload that fails to decode is reported under "error"/"error_kind"
// instead of throwing.
nlohmann::json frame_to_json(const Frame& frame);

} // namespace protocol
