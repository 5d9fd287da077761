#include "security.hpp"
#include <sodium.h>
#include <array>
#include <cstdint>
#include <random>
#include <sstream>
#include <iomanip>
#include <iostream>

namespace security {

namespace {

std::string to_hex(const std::array<uint8_t, 16>& bytes) {
    std::ostringstream oss;
    for (uint8_t b : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

} // namespace

std::string generate_transfer_id() {
    std::array<uint8_t, 16> raw;
    if (sodium_init() < 0) {
        std::cerr << "libsodium initialization failed!\n";
        // Fallback to std::random_device
        std::random_device rd;
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : raw) {
            b = static_cast<uint8_t>(dist(rd));
        }
        return to_hex(raw);
    }
    randombytes_buf(raw.data(), raw.size());
    return to_hex(raw);
}

} // namespace security
