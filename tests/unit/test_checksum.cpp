#include <gtest/gtest.h>
#include "chunkvault/crypto/checksum.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/crypto/random.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace chunkvault::crypto;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

}

TEST(Crc32Test, KnownVector) {
    auto data = bytes_of("123456789");
    EXPECT_EQ(Crc32::compute(data), 0xCBF43926u);
}

TEST(Crc32Test, EmptyInput) {
    std::vector<std::uint8_t> empty;
    EXPECT_EQ(Crc32::compute(empty), 0u);
}

TEST(Crc32Test, IncrementalMatchesOneShot) {
    auto data = bytes_of("The quick brown fox jumps over the lazy dog");
    
    Crc32 crc;
    crc.update(std::span<const std::uint8_t>(data).first(10));
    crc.update(std::span<const std::uint8_t>(data).subspan(10));
    
    EXPECT_EQ(crc.value(), Crc32::compute(data));
    EXPECT_EQ(crc.value(), 0x414FA339u);
    
    crc.reset();
    EXPECT_EQ(crc.value(), 0u);
}

TEST(Crc32Test, DetectsSingleFlippedByte) {
    auto data = bytes_of("chunk payload");
    auto original = Crc32::compute(data);
    
    data[4] ^= 0x01;
    EXPECT_NE(Crc32::compute(data), original);
}

class ContentHasherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
        test_file_ = std::filesystem::temp_directory_path() / "chunkvault_hash_test.bin";
    }
    
    void TearDown() override {
        std::filesystem::remove(test_file_);
    }
    
    std::filesystem::path test_file_;
};

TEST_F(ContentHasherTest, EmptyInputMatchesBlake2b256) {
    std::vector<std::uint8_t> empty;
    EXPECT_EQ(hash_utils::hash_to_hex(ContentHasher::hash(empty)),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST_F(ContentHasherTest, StreamingMatchesOneShot) {
    std::vector<std::uint8_t> data(200000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    
    ContentHasher hasher;
    hasher.update(std::span<const std::uint8_t>(data).first(12345));
    hasher.update(std::span<const std::uint8_t>(data).subspan(12345));
    
    EXPECT_EQ(hasher.finalize(), ContentHasher::hash(data));
}

TEST_F(ContentHasherTest, HashFile) {
    auto data = bytes_of(std::string(70000, 'z'));
    {
        std::ofstream file(test_file_, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    
    auto file_hash = ContentHasher::hash_file(test_file_);
    ASSERT_TRUE(file_hash.has_value());
    EXPECT_EQ(*file_hash, ContentHasher::hash(data));
    
    EXPECT_FALSE(ContentHasher::hash_file(test_file_.parent_path() / "no_such_file.bin").has_value());
}

TEST_F(ContentHasherTest, HexRoundTrip) {
    auto hash = ContentHasher::hash(bytes_of("record"));
    auto hex = hash_utils::hash_to_hex(hash);
    
    EXPECT_EQ(hex.size(), CONTENT_HASH_SIZE * 2);
    auto parsed = hash_utils::hash_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, hash);
    
    EXPECT_FALSE(hash_utils::hash_from_hex("xyz").has_value());
}
