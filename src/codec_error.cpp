#include "protocol/codec_error.hpp"

namespace protocol {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRUNCATED_READ:
            return "truncated read";
        case ErrorKind::INVALID_LENGTH:
            return "invalid length";
        case ErrorKind::STRING_TOO_LARGE:
            return "string too large";
    }
    return "unknown";
}

CodecError::CodecError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace protocol
