/**
 * @file test_integrity_verifier.cpp
 * @brief Unit tests for ZIP structural verification
 */

#include <gtest/gtest.h>

#include <archive_fetch/core/integrity_verifier.h>

#include "../../support/zip_builder.h"

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace archive_fetch::test {

namespace {

auto bytes_of(const std::string& text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

}  // namespace

class IntegrityVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("archive_fetch_verifier_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write(const std::string& name, const std::vector<uint8_t>& bytes)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        zip_builder::write_file(path, bytes);
        return path;
    }

    auto write_text(const std::string& name, const std::string& text) -> std::filesystem::path {
        return write(name, std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::filesystem::path test_dir_;
    integrity_verifier verifier_;
};

// Valid archives

TEST_F(IntegrityVerifierTest, StoredArchiveIsValid) {
    auto path = write("ok.zip", zip_builder()
                                    .add_entry("a.txt", "hello")
                                    .add_random_entry("b.bin", 32 * 1024, 1)
                                    .build());

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().is_valid());
    EXPECT_EQ(report.value().entry_count, 2u);
    EXPECT_EQ(report.value().entries_crc_checked, 2u);
}

TEST_F(IntegrityVerifierTest, DeflatedArchiveIsValid) {
    std::string text;
    for (int i = 0; i < 2000; ++i) {
        text += "line " + std::to_string(i) + "\n";
    }
    auto path = write("deflated.zip", zip_builder().add_deflated_entry("log.txt", text).build());

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().verdict, integrity_verdict::valid) << report.value().reason;
    EXPECT_EQ(report.value().entries_crc_checked, 1u);
}

TEST_F(IntegrityVerifierTest, EmptyArchiveIsValid) {
    auto path = write("empty.zip", zip_builder().build());

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().is_valid());
    EXPECT_EQ(report.value().entry_count, 0u);
}

// Corruption

TEST_F(IntegrityVerifierTest, FlippedPayloadByteIsCorrupt) {
    auto archive = zip_builder::archive_of_size(64 * 1024, 2);
    auto path = write("flipped.zip", zip_builder::with_flipped_byte(archive));

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().verdict, integrity_verdict::corrupt);
    EXPECT_FALSE(report.value().reason.empty());
}

TEST_F(IntegrityVerifierTest, FlippedByteUndetectedWithoutCrcCheck) {
    auto archive = zip_builder::archive_of_size(64 * 1024, 2);
    auto path = write("flipped.zip", zip_builder::with_flipped_byte(archive));

    integrity_verifier structural_only(verifier_options{false});
    auto report = structural_only.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().is_valid());
    EXPECT_EQ(report.value().entries_crc_checked, 0u);
}

TEST_F(IntegrityVerifierTest, TruncatedArchiveIsCorrupt) {
    auto archive = zip_builder::archive_of_size(64 * 1024, 3);
    archive.resize(archive.size() / 2);
    auto path = write("truncated.zip", archive);

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().verdict, integrity_verdict::corrupt);
}

TEST_F(IntegrityVerifierTest, TrailingGarbageAfterDirectoryIsCorrupt) {
    auto archive = zip_builder::archive_of_size(16 * 1024, 4);
    auto full = archive;
    full.insert(full.end(), archive.begin(), archive.begin() + 100);
    auto path = write("appended.zip", full);

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_NE(report.value().verdict, integrity_verdict::valid);
}

TEST_F(IntegrityVerifierTest, Zip64DirectoryBoundsThatWrapAreCorrupt) {
    std::vector<uint8_t> bytes{'P', 'K', 0x03, 0x04};
    auto put = [&bytes](uint64_t value, int width) {
        for (int i = 0; i < width; ++i) {
            bytes.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    };

    // ZIP64 end of central directory record at offset 4
    put(0x06064b50, 4);
    put(44, 8);
    put(45, 2);
    put(45, 2);
    put(0, 4);
    put(0, 4);
    put(0, 8);                     // entries on this disk
    put(0, 8);                     // entries total
    put(UINT64_MAX, 8);            // directory size
    put(1, 8);                     // directory offset

    // ZIP64 locator
    put(0x07064b50, 4);
    put(0, 4);
    put(4, 8);
    put(1, 4);

    // Classic end record deferring every field to ZIP64
    put(0x06054b50, 4);
    put(0xFFFF, 2);
    put(0xFFFF, 2);
    put(0xFFFF, 2);
    put(0xFFFF, 2);
    put(0xFFFFFFFF, 4);
    put(0xFFFFFFFF, 4);
    put(0, 2);

    auto path = write("wrapping.zip", bytes);

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().verdict, integrity_verdict::corrupt);
}

// Authentication failure payloads

TEST_F(IntegrityVerifierTest, HtmlLoginPageIsAuthFailure) {
    auto path = write_text("login.zip",
                           "<!DOCTYPE html><html><head><title>Sign in</title></head></html>");

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().verdict, integrity_verdict::auth_failure);
    EXPECT_EQ(report.value().reason, "HTML page");
}

TEST_F(IntegrityVerifierTest, EmptyFileIsAuthFailure) {
    auto path = write("empty.bin", {});

    auto report = verifier_.verify_file(path);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().verdict, integrity_verdict::auth_failure);
    EXPECT_EQ(report.value().reason, "empty file");
}

TEST_F(IntegrityVerifierTest, MissingFileIsReadError) {
    auto report = verifier_.verify_file(test_dir_ / "missing.zip");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::file_read_error);
}

// Prefix checks

TEST_F(IntegrityVerifierTest, VerifyPrefix_PartialArchiveIsValid) {
    auto archive = zip_builder::archive_of_size(8 * 1024, 5);
    archive.resize(100);
    auto path = write("partial.zip.part", archive);

    auto verdict = verifier_.verify_prefix(path);
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict.value(), integrity_verdict::valid);
}

TEST_F(IntegrityVerifierTest, VerifyPrefix_EmptyFileIsValid) {
    auto path = write("nothing.part", {});

    auto verdict = verifier_.verify_prefix(path);
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict.value(), integrity_verdict::valid);
}

TEST_F(IntegrityVerifierTest, VerifyPrefix_HtmlIsAuthFailure) {
    auto path = write_text("page.part", "<html><body>expired</body></html>");

    auto verdict = verifier_.verify_prefix(path);
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict.value(), integrity_verdict::auth_failure);
}

TEST(IntegrityClassifyTest, ClassifyPrefix) {
    EXPECT_EQ(integrity_verifier::classify_prefix(bytes_of("PK\x03\x04rest")),
              integrity_verdict::valid);
    EXPECT_EQ(integrity_verifier::classify_prefix(bytes_of("PK")), integrity_verdict::valid);
    EXPECT_EQ(integrity_verifier::classify_prefix(bytes_of("PX")),
              integrity_verdict::auth_failure);
    EXPECT_EQ(integrity_verifier::classify_prefix(bytes_of("{\"error\":1}")),
              integrity_verdict::auth_failure);
}

TEST(IntegrityClassifyTest, DescribePayload) {
    EXPECT_EQ(integrity_verifier::describe_payload(bytes_of("  <HTML lang=en>")), "HTML page");
    EXPECT_EQ(integrity_verifier::describe_payload(bytes_of("<?xml version=")),
              "markup document");
    EXPECT_EQ(integrity_verifier::describe_payload(bytes_of("{\"error\":\"denied\"}")),
              "JSON document");
    EXPECT_EQ(integrity_verifier::describe_payload(bytes_of(" \r\n")), "blank payload");
    EXPECT_EQ(integrity_verifier::describe_payload(bytes_of("garbage")), "unrecognized data");
}

TEST(IntegrityClassifyTest, MarkupContentTypes) {
    EXPECT_TRUE(integrity_verifier::is_markup_content_type("text/html; charset=UTF-8"));
    EXPECT_TRUE(integrity_verifier::is_markup_content_type("Application/XHTML+xml"));
    EXPECT_FALSE(integrity_verifier::is_markup_content_type("application/zip"));
    EXPECT_FALSE(integrity_verifier::is_markup_content_type("application/octet-stream"));
    EXPECT_FALSE(integrity_verifier::is_markup_content_type(""));
}

}  // namespace archive_fetch::test
