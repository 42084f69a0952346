/**
 * @file test_url_template.cpp
 * @brief Unit tests for sequence URL templates
 */

#include <gtest/gtest.h>

#include <archive_fetch/core/url_template.h>

namespace archive_fetch::test {

TEST(UrlTemplateTest, Parse_TakeoutStyleUrl) {
    auto tmpl = url_template::parse(
        "https://takeout.example.com/dl/takeout-20240101T000000Z-001.zip?j=abc&i=0");
    ASSERT_TRUE(tmpl.has_value()) << tmpl.error().message;

    EXPECT_EQ(tmpl.value().parsed_index(), 1u);
    EXPECT_EQ(tmpl.value().width(), 3u);
    EXPECT_EQ(tmpl.value().filename_for(12), "takeout-20240101T000000Z-012.zip");
    EXPECT_EQ(tmpl.value().url_for(12),
              "https://takeout.example.com/dl/takeout-20240101T000000Z-012.zip?j=abc&i=0");
}

TEST(UrlTemplateTest, Parse_KeepsQueryString) {
    auto tmpl = url_template::parse("https://host/a/export-01.zip?token=xyz&user=1");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_EQ(tmpl.value().url_for(2), "https://host/a/export-02.zip?token=xyz&user=1");
}

TEST(UrlTemplateTest, Parse_WithoutQueryString) {
    auto tmpl = url_template::parse("https://host/part7.zip");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_EQ(tmpl.value().parsed_index(), 7u);
    EXPECT_EQ(tmpl.value().url_for(10), "https://host/part10.zip");
}

TEST(UrlTemplateTest, Parse_MultiPartExtension) {
    auto tmpl = url_template::parse("https://host/backup-003.tar.gz");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_EQ(tmpl.value().filename_for(4), "backup-004.tar.gz");
}

TEST(UrlTemplateTest, Pad_WiderIndexIsNotTruncated) {
    auto tmpl = url_template::parse("https://host/archive-01.zip");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_EQ(tmpl.value().filename_for(123), "archive-123.zip");
}

TEST(UrlTemplateTest, Parse_DropsFragmentFromGeneratedUrls) {
    auto tmpl = url_template::parse("https://host/archive-001.zip#section");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_EQ(tmpl.value().url_for(2), "https://host/archive-002.zip");
    EXPECT_EQ(tmpl.value().source(), "https://host/archive-001.zip#section");
}

TEST(UrlTemplateTest, Parse_RejectsMissingSuffix) {
    auto tmpl = url_template::parse("https://host/archive.zip");
    ASSERT_FALSE(tmpl.has_value());
    EXPECT_EQ(tmpl.error().code, error_code::invalid_url_template);
}

TEST(UrlTemplateTest, Parse_RejectsMissingExtension) {
    EXPECT_FALSE(url_template::parse("https://host/archive-001").has_value());
}

TEST(UrlTemplateTest, Parse_RejectsEmptyAndPathless) {
    EXPECT_FALSE(url_template::parse("").has_value());
    EXPECT_FALSE(url_template::parse("https://host").has_value());
}

TEST(UrlTemplateTest, IndexOf_RecoversIndex) {
    auto tmpl = url_template::parse("https://host/takeout-001.zip?x=1");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_EQ(tmpl.value().index_of("takeout-042.zip"), 42u);
    EXPECT_EQ(tmpl.value().index_of("takeout-1000.zip"), 1000u);
}

TEST(UrlTemplateTest, IndexOf_RejectsForeignNames) {
    auto tmpl = url_template::parse("https://host/takeout-001.zip");
    ASSERT_TRUE(tmpl.has_value());

    EXPECT_FALSE(tmpl.value().index_of("other-001.zip").has_value());
    EXPECT_FALSE(tmpl.value().index_of("takeout-001.zip.partial").has_value());
    EXPECT_FALSE(tmpl.value().index_of("takeout-abc.zip").has_value());
    EXPECT_FALSE(tmpl.value().index_of("takeout-.zip").has_value());
}

}  // namespace archive_fetch::test
