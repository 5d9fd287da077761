#pragma once

#include <string>

namespace security {

// 16 random bytes from libsodium's CSPRNG as 32 lowercase hex characters.
// Used as the transfer_id correlating a GET_FILE with its FILE_CHUNKs.
std::string generate_transfer_id();

} // namespace security
