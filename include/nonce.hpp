#pragma once

#include <string>
#include <iomanip>
#include <sstream>
#include <openssl/rand.h>

#include "errors.hpp"

namespace throttle {

// Random disambiguators for window members recorded in the same millisecond.
class NonceGenerator {
public:
    static std::string generate(size_t bytes = 8) {
        unsigned char buffer[32];
        if (bytes == 0 || bytes > sizeof(buffer)) {
            throw ConfigurationError("nonce length must be between 1 and 32 bytes");
        }
        if (RAND_bytes(buffer, static_cast<int>(bytes)) != 1) {
            throw BackingStoreError("CSPRNG failure while generating nonce");
        }

        std::stringstream ss;
        for (size_t i = 0; i < bytes; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)buffer[i];
        }
        return ss.str();
    }
};

}
