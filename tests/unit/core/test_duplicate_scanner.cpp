/**
 * @file test_duplicate_scanner.cpp
 * @brief Unit tests for duplicate archive detection
 */

#include <gtest/gtest.h>

#include <archive_fetch/core/duplicate_scanner.h>

#include "../../support/zip_builder.h"

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace archive_fetch::test {

class DuplicateScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("archive_fetch_dedupe_" + std::to_string(std::random_device{}()));
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

    std::filesystem::path test_dir_;
    duplicate_scanner scanner_;
};

TEST_F(DuplicateScannerTest, NoDuplicates) {
    write("takeout-001.zip", zip_builder::archive_of_size(10000, 1));
    write("takeout-002.zip", zip_builder::archive_of_size(10000, 2));
    write("takeout-003.zip", zip_builder::archive_of_size(12000, 3));

    auto groups = scanner_.scan(test_dir_);
    ASSERT_TRUE(groups.has_value());
    EXPECT_TRUE(groups.value().empty());
}

TEST_F(DuplicateScannerTest, FindsCopiesAndKeepsLowestName) {
    auto archive = zip_builder::archive_of_size(10000, 1);
    write("takeout-002.zip", archive);
    write("takeout-001.zip", archive);
    write("takeout-001 (1).zip", archive);
    write("takeout-003.zip", zip_builder::archive_of_size(10000, 9));

    auto groups = scanner_.scan(test_dir_);
    ASSERT_TRUE(groups.has_value());
    ASSERT_EQ(groups.value().size(), 1u);

    const auto& group = groups.value().front();
    EXPECT_EQ(group.size, archive.size());
    EXPECT_EQ(group.keep.filename(), "takeout-001 (1).zip");
    ASSERT_EQ(group.duplicates.size(), 2u);
    EXPECT_EQ(group.duplicates[0].filename(), "takeout-001.zip");
    EXPECT_EQ(group.duplicates[1].filename(), "takeout-002.zip");
    EXPECT_EQ(group.reclaimable_bytes(), 2 * archive.size());
}

TEST_F(DuplicateScannerTest, LargeFilesDifferingInTailAreDistinct) {
    auto archive = zip_builder::archive_of_size(300 * 1024, 5);
    auto changed = archive;
    changed[changed.size() - 30] ^= 0x01;
    write("a.zip", archive);
    write("b.zip", changed);

    auto groups = scanner_.scan(test_dir_);
    ASSERT_TRUE(groups.has_value());
    EXPECT_TRUE(groups.value().empty());
}

TEST_F(DuplicateScannerTest, IgnoresOtherExtensions) {
    auto archive = zip_builder::archive_of_size(10000, 1);
    write("takeout-001.zip", archive);
    write("takeout-001.zip.partial", archive);

    auto groups = scanner_.scan(test_dir_);
    ASSERT_TRUE(groups.has_value());
    EXPECT_TRUE(groups.value().empty());
}

TEST_F(DuplicateScannerTest, ScanRejectsMissingDirectory) {
    auto groups = scanner_.scan(test_dir_ / "nope");
    ASSERT_FALSE(groups.has_value());
    EXPECT_EQ(groups.error().code, error_code::file_read_error);
}

TEST_F(DuplicateScannerTest, DryRunKeepsFiles) {
    auto archive = zip_builder::archive_of_size(10000, 1);
    write("a.zip", archive);
    auto copy = write("b.zip", archive);

    auto groups = scanner_.scan(test_dir_);
    ASSERT_TRUE(groups.has_value());
    auto summary = scanner_.remove(groups.value(), true);
    ASSERT_TRUE(summary.has_value());

    EXPECT_TRUE(summary.value().dry_run);
    EXPECT_EQ(summary.value().files_removed, 1u);
    EXPECT_EQ(summary.value().bytes_freed, archive.size());
    EXPECT_TRUE(std::filesystem::exists(copy));
}

TEST_F(DuplicateScannerTest, RemoveDeletesDuplicatesOnly) {
    auto archive = zip_builder::archive_of_size(10000, 1);
    auto original = write("a.zip", archive);
    auto copy = write("b.zip", archive);

    auto groups = scanner_.scan(test_dir_);
    ASSERT_TRUE(groups.has_value());
    auto summary = scanner_.remove(groups.value(), false);
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().files_removed, 1u);
    EXPECT_TRUE(std::filesystem::exists(original));
    EXPECT_FALSE(std::filesystem::exists(copy));
}

TEST_F(DuplicateScannerTest, FingerprintMissingFileFails) {
    EXPECT_FALSE(duplicate_scanner::fingerprint(test_dir_ / "absent.zip", 10).has_value());
}

}  // namespace archive_fetch::test
