#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace protocol {

// Caps on peer-declared lengths. A single 4-byte length field must never
// translate into an allocation larger than these.
constexpr int32_t kMaxStringLength = 50000000;          // 50MB
constexpr int32_t kMaxChunkLength = 100 * 1024 * 1024;  // 100MiB

// No frame cap unless the caller asks for one.
constexpr int32_t kDefaultMaxFrameLength = std::numeric_limits<int32_t>::max();

// Length-prefixed reads grow their buffer by at most this much per step.
constexpr std::size_t kChunkReadStep = 64 * 1024;

// Size of the FILE_CHUNK slices the sender cuts a file into.
constexpr std::size_t kTransferChunkSize = 64 * 1024;

} // namespace protocol
