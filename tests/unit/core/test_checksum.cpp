/**
 * @file test_checksum.cpp
 * @brief Unit tests for CRC-32 and SHA-256 helpers
 */

#include <gtest/gtest.h>

#include <archive_fetch/core/checksum.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace archive_fetch::test {

namespace {

auto bytes_of(const std::string& text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("archive_fetch_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

// CRC-32

TEST_F(ChecksumTest, Crc32_CheckValue) {
    EXPECT_EQ(checksum::crc32(bytes_of("123456789")), 0xCBF43926u);
}

TEST_F(ChecksumTest, Crc32_EmptyIsZero) {
    EXPECT_EQ(checksum::crc32({}), 0u);
}

TEST_F(ChecksumTest, Crc32_UpdateMatchesSinglePass) {
    const std::string text = "The quick brown fox jumps over the lazy dog";
    auto whole = checksum::crc32(bytes_of(text));

    auto crc = checksum::crc32_update(0, bytes_of(text.substr(0, 10)));
    crc = checksum::crc32_update(crc, bytes_of(text.substr(10)));

    EXPECT_EQ(crc, whole);
    EXPECT_EQ(whole, 0x414FA339u);
}

// SHA-256

TEST_F(ChecksumTest, Sha256_KnownVector) {
    auto digest = checksum::sha256(bytes_of("abc"));
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, Sha256_Empty) {
    auto digest = checksum::sha256({});
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, Sha256Hasher_IncrementalMatchesOneShot) {
    sha256_hasher hasher;
    ASSERT_TRUE(hasher.update(bytes_of("a")).has_value());
    ASSERT_TRUE(hasher.update(bytes_of("bc")).has_value());
    auto digest = hasher.finish();
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(), checksum::sha256(bytes_of("abc")).value());
}

TEST_F(ChecksumTest, Sha256File_MatchesBuffer) {
    std::string content(200 * 1024, '\0');
    std::mt19937 gen(3);
    for (auto& c : content) {
        c = static_cast<char>(gen() & 0xFF);
    }
    auto path = test_dir_ / "payload.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    auto from_file = checksum::sha256_file(path);
    ASSERT_TRUE(from_file.has_value());
    EXPECT_EQ(from_file.value(), checksum::sha256(bytes_of(content)).value());
}

TEST_F(ChecksumTest, Sha256File_MissingFileFails) {
    auto digest = checksum::sha256_file(test_dir_ / "missing.bin");
    EXPECT_FALSE(digest.has_value());
}

}  // namespace archive_fetch::test
