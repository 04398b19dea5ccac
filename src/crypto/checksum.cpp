#include "chunkvault/crypto/checksum.hpp"
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace chunkvault::crypto {

Crc32::Crc32() : crc_(static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0))) {
}

void Crc32::update(std::span<const std::uint8_t> data) {
    // zlib takes a uInt length, feed very large spans in slices
    constexpr size_t max_slice = std::numeric_limits<uInt>::max();
    
    while (!data.empty()) {
        size_t slice = std::min(data.size(), max_slice);
        crc_ = static_cast<std::uint32_t>(
            crc32(crc_, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(slice)));
        data = data.subspan(slice);
    }
}

void Crc32::reset() {
    crc_ = static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0));
}

std::uint32_t Crc32::compute(std::span<const std::uint8_t> data) {
    Crc32 crc;
    crc.update(data);
    return crc.value();
}

}
