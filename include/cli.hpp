#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "protocol/limits.hpp"

namespace cli {

struct Options {
    std::vector<std::string> args;  // positionals after the command
    std::string output;             // -o
    int32_t max_frame_length = protocol::kDefaultMaxFrameLength;  // --max-frame
    uint64_t offset = 0;            // --offset, resume point for send
};

// Parses argv[2..]. Throws std::invalid_argument for a flag without a
// value, a non-numeric value, or a --max-frame below the 4-byte header.
Options parse_options(int argc, char* argv[]);

} // namespace cli
