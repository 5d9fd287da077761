#include "cli.hpp"
#include "protocol/frame.hpp"
#include <stdexcept>

namespace cli {

namespace {

const char* flag_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    Options opts;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-o") {
            opts.output = flag_value(argc, argv, i);
        } else if (arg == "--max-frame") {
            long long value = std::stoll(flag_value(argc, argv, i));
            if (value < protocol::kHeaderLength || value > protocol::kDefaultMaxFrameLength) {
                throw std::invalid_argument("--max-frame must be between " +
                                            std::to_string(protocol::kHeaderLength) + " and " +
                                            std::to_string(protocol::kDefaultMaxFrameLength));
            }
            opts.max_frame_length = static_cast<int32_t>(value);
        } else if (arg == "--offset") {
            long long value = std::stoll(flag_value(argc, argv, i));
            if (value < 0) {
                throw std::invalid_argument("--offset must not be negative");
            }
            opts.offset = static_cast<uint64_t>(value);
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

} // namespace cli
