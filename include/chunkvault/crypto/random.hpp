#pragma once

#include <cstdint>
#include <span>

namespace chunkvault::crypto {

class SecureRandom {
public:
    // Initializes libsodium. Safe to call repeatedly and from several threads.
    static bool initialize();
    
    static void fill(std::span<std::uint8_t> output);
};

}
