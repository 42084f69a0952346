/**
 * @file test_http_transport.cpp
 * @brief Unit tests for range request and response helpers
 */

#include <gtest/gtest.h>

#include <archive_fetch/transport/http_transport.h>
#include <archive_fetch/transport/network_http_transport.h>

#include <string>

namespace archive_fetch::test {

// =============================================================================
// range_request Tests
// =============================================================================

TEST(RangeRequestTest, FullGetHasNoRangeHeader) {
    range_request request;
    request.url = "https://host/a-001.zip";

    EXPECT_FALSE(request.range_header().has_value());
    EXPECT_EQ(request.build_headers().count("Range"), 0u);
}

TEST(RangeRequestTest, BoundedRange) {
    range_request request;
    request.range_start = 1024;
    request.range_end = 2047;

    EXPECT_EQ(request.range_header(), "bytes=1024-2047");
}

TEST(RangeRequestTest, OpenEndedRange) {
    range_request request;
    request.range_start = 500;

    EXPECT_EQ(request.range_header(), "bytes=500-");
}

TEST(RangeRequestTest, FirstWindowFromZero) {
    range_request request;
    request.range_end = 4095;

    EXPECT_EQ(request.range_header(), "bytes=0-4095");
}

TEST(RangeRequestTest, HeadersCarryCredentialAndIdentityEncoding) {
    range_request request;
    request.credential = "SID=abc";
    request.range_start = 10;
    request.range_end = 20;

    auto headers = request.build_headers();

    EXPECT_EQ(headers["Cookie"], "SID=abc");
    EXPECT_EQ(headers["Accept-Encoding"], "identity");
    EXPECT_EQ(headers["Range"], "bytes=10-20");
    EXPECT_EQ(headers["User-Agent"], std::string(DEFAULT_USER_AGENT));
}

TEST(RangeRequestTest, CustomCredentialHeader) {
    range_request request;
    request.credential_header = "Authorization";
    request.credential = "Bearer xyz";

    auto headers = request.build_headers();

    EXPECT_EQ(headers["Authorization"], "Bearer xyz");
    EXPECT_EQ(headers.count("Cookie"), 0u);
}

TEST(RangeRequestTest, EmptyCredentialIsOmitted) {
    range_request request;

    EXPECT_EQ(request.build_headers().count("Cookie"), 0u);
}

// =============================================================================
// content_range Tests
// =============================================================================

TEST(ContentRangeTest, ParseSatisfied) {
    auto range = content_range::parse("bytes 100-199/1000");
    ASSERT_TRUE(range.has_value());
    EXPECT_TRUE(range->satisfied);
    EXPECT_EQ(range->first, 100u);
    EXPECT_EQ(range->last, 199u);
    EXPECT_EQ(range->total, 1000u);
    EXPECT_EQ(range->length(), 100u);
}

TEST(ContentRangeTest, ParseUnknownTotal) {
    auto range = content_range::parse("bytes 0-9/*");
    ASSERT_TRUE(range.has_value());
    EXPECT_TRUE(range->satisfied);
    EXPECT_FALSE(range->total.has_value());
}

TEST(ContentRangeTest, ParseUnsatisfied) {
    auto range = content_range::parse("bytes */5000");
    ASSERT_TRUE(range.has_value());
    EXPECT_FALSE(range->satisfied);
    EXPECT_EQ(range->total, 5000u);
    EXPECT_EQ(range->length(), 0u);
}

TEST(ContentRangeTest, ParseIsCaseAndSpaceTolerant) {
    auto range = content_range::parse("  Bytes  0-0 / 1 ");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->total, 1u);
}

TEST(ContentRangeTest, ParseRejectsMalformed) {
    EXPECT_FALSE(content_range::parse("").has_value());
    EXPECT_FALSE(content_range::parse("items 0-1/2").has_value());
    EXPECT_FALSE(content_range::parse("bytes 5-1/10").has_value());
    EXPECT_FALSE(content_range::parse("bytes 0-10/10").has_value());
    EXPECT_FALSE(content_range::parse("bytes */*").has_value());
    EXPECT_FALSE(content_range::parse("bytes 0-1").has_value());
    EXPECT_FALSE(content_range::parse("bytes a-b/10").has_value());
}

// =============================================================================
// range_response Tests
// =============================================================================

TEST(RangeResponseTest, HeaderLookupIsCaseInsensitive) {
    range_response response;
    response.headers["content-type"] = "Application/Zip";

    EXPECT_EQ(response.get_header("Content-Type"), "Application/Zip");
    EXPECT_FALSE(response.get_header("Content-Range").has_value());
}

TEST(RangeResponseTest, ContentTypeDropsParameters) {
    range_response response;
    response.headers["Content-Type"] = "Text/HTML; charset=UTF-8";

    EXPECT_EQ(response.content_type(), "text/html");
}

TEST(RangeResponseTest, ContentTypeEmptyWhenAbsent) {
    range_response response;

    EXPECT_TRUE(response.content_type().empty());
}

TEST(RangeResponseTest, TotalSizeFromContentRange) {
    range_response response;
    response.status_code = 206;
    response.headers["Content-Range"] = "bytes 0-99/12345";
    response.headers["Content-Length"] = "100";

    EXPECT_EQ(response.total_size(), 12345u);
    EXPECT_EQ(response.content_length(), 100u);
}

TEST(RangeResponseTest, TotalSizeFor416) {
    range_response response;
    response.status_code = 416;
    response.headers["Content-Range"] = "bytes */777";

    EXPECT_EQ(response.total_size(), 777u);
}

TEST(RangeResponseTest, TotalSizeFor200) {
    range_response response;
    response.status_code = 200;
    response.body.resize(64);

    EXPECT_EQ(response.total_size(), 64u);

    response.headers["Content-Length"] = "4096";
    EXPECT_EQ(response.total_size(), 4096u);
}

TEST(RangeResponseTest, TotalSizeUnknownForErrors) {
    range_response response;
    response.status_code = 404;
    response.headers["Content-Length"] = "10";

    EXPECT_FALSE(response.total_size().has_value());
}

TEST(RangeResponseTest, StatusClasses) {
    range_response response;
    response.status_code = 206;
    EXPECT_TRUE(response.is_success());

    response.status_code = 403;
    EXPECT_TRUE(response.is_client_error());

    response.status_code = 503;
    EXPECT_TRUE(response.is_server_error());
    EXPECT_FALSE(response.is_success());
}

// =============================================================================
// network_http_transport Tests
// =============================================================================

TEST(NetworkHttpTransportTest, NameAndAvailability) {
    network_http_transport transport(std::chrono::seconds(5));

    EXPECT_EQ(transport.name(), "network_system");
    if (!network_http_transport::is_available()) {
        range_request request;
        request.url = "https://host/a-001.zip";
        auto response = transport.fetch(request);
        ASSERT_FALSE(response.has_value());
        EXPECT_EQ(response.error().code, error_code::connection_failed);
    }
}

}  // namespace archive_fetch::test
