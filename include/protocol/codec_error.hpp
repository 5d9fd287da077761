#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

enum class ErrorKind {
    TRUNCATED_READ,   // stream ended before a declared/required length
    INVALID_LENGTH,   // length field outside its bound
    STRING_TOO_LARGE  // encode-time string cap
};

const char* to_string(ErrorKind kind);

// Thrown by every encode/decode path. A stream that produced one is
// desynchronized and should be closed; nothing here tries to recover.
class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace protocol
