#include "security.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

int main() {
    std::string a = security::generate_transfer_id();
    std::string b = security::generate_transfer_id();

    if (a.size() != 32 || b.size() != 32) {
        std::printf("Transfer id length test failed: %zu\n", a.size());
        return EXIT_FAILURE;
    }
    for (char c : a) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) {
            std::printf("Transfer id charset test failed: %s\n", a.c_str());
            return EXIT_FAILURE;
        }
    }
    if (a == b) {
        std::printf("Transfer id uniqueness test failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All security tests passed\n");

    return EXIT_SUCCESS;
}
