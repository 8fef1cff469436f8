#pragma once

#include "tinyboard/common.hpp"
#include <string>

namespace tinyboard::crypto {

/**
 * Random number generation (CSPRNG)
 * Cryptographically secure random bytes from libsodium
 */
class Random {
public:
    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);

    /**
     * Generate a random (version 4) UUID in canonical lowercase form,
     * e.g. "3f1c2a7e-5b0d-4c8e-9a61-0f2d4e6b8c1a"
     */
    static std::string uuid_v4();
};

} // namespace tinyboard::crypto
