#include "random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace tinyboard::crypto {

namespace {
    // Ensure libsodium is initialized
    struct SodiumInitializer {
        SodiumInitializer() {
            if (sodium_init() < 0) {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    };
    static SodiumInitializer sodium_init_instance;
} // anonymous namespace

bytes Random::generate(size_t size) {
    bytes result(size);
    randombytes_buf(result.data(), size);
    return result;
}

std::string Random::uuid_v4() {
    static constexpr char kHex[] = "0123456789abcdef";

    auto raw = generate(16);

    // RFC 4122: version 4, variant 10xx
    raw[6] = static_cast<byte>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<byte>((raw[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[(raw[i] >> 4) & 0x0F]);
        out.push_back(kHex[raw[i] & 0x0F]);
    }
    return out;
}

} // namespace tinyboard::crypto
