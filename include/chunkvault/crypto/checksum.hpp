#pragma once

#include <cstdint>
#include <span>

namespace chunkvault::crypto {

// Incremental CRC-32 (zlib polynomial). Detects accidental corruption of
// stored chunks; it offers no protection against deliberate tampering.
class Crc32 {
public:
    Crc32();
    
    void update(std::span<const std::uint8_t> data);
    std::uint32_t value() const { return crc_; }
    void reset();
    
    static std::uint32_t compute(std::span<const std::uint8_t> data);

private:
    std::uint32_t crc_;
};

}
