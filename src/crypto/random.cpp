#include "chunkvault/crypto/random.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace chunkvault::crypto {

bool SecureRandom::initialize() {
    // sodium_init returns 1 when the library was already initialized
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    return true;
}

void SecureRandom::fill(std::span<std::uint8_t> output) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not available");
    }
    randombytes_buf(output.data(), output.size());
}

}
