#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkvault::crypto {

constexpr size_t CONTENT_HASH_SIZE = 32;

using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;

// Streaming BLAKE2b-256 (libsodium crypto_generichash). Used for the
// content hash stored on persisted records.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    void update(std::span<const std::uint8_t> data);
    ContentHash finalize();
    
    static ContentHash hash(std::span<const std::uint8_t> data);
    
    // Reads the file in fixed-size blocks. Returns nullopt if the file
    // cannot be opened or read.
    static std::optional<ContentHash> hash_file(const std::filesystem::path& file_path);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash);
std::optional<ContentHash> hash_from_hex(const std::string& hex_string);

}

}
