#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/crypto/random.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto {

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
    if (!SecureRandom::initialize() ||
        crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_HASH_SIZE) != 0) {
        throw std::runtime_error("Failed to initialize content hasher");
    }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("Content hasher already finalized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        throw std::runtime_error("Failed to update content hash");
    }
}

ContentHash ContentHasher::finalize() {
    if (finalized_) {
        throw std::logic_error("Content hasher already finalized");
    }
    
    ContentHash result;
    if (crypto_generichash_final(&impl_->state, result.data(), result.size()) != 0) {
        throw std::runtime_error("Failed to finalize content hash");
    }
    
    finalized_ = true;
    return result;
}

ContentHash ContentHasher::hash(std::span<const std::uint8_t> data) {
    ContentHasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::optional<ContentHash> ContentHasher::hash_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for hashing", file_path.string());
        return std::nullopt;
    }
    
    ContentHasher hasher;
    
    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);
    
    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        
        if (bytes_read > 0) {
            hasher.update(std::span(buffer.data(), bytes_read));
        }
    }
    
    if (file.bad()) {
        LOG_WARN("Read error while hashing {}", file_path.string());
        return std::nullopt;
    }
    
    return hasher.finalize();
}

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<ContentHash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != CONTENT_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    ContentHash hash;
    for (size_t i = 0; i < CONTENT_HASH_SIZE; ++i) {
        std::string byte_str = hex_string.substr(i * 2, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte_str[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byte_str[1]))) {
            return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>(std::stoul(byte_str, nullptr, 16));
    }
    
    return hash;
}

}

}
