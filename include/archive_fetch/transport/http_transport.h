// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file http_transport.h
 * @brief HTTP range request abstraction
 * @version 0.1.0
 *
 * This file defines the transport seam used by resumable transfers. The
 * production implementation wraps network_system's HTTP client; tests plug
 * in an in-memory implementation.
 */

#ifndef ARCHIVE_FETCH_TRANSPORT_HTTP_TRANSPORT_H
#define ARCHIVE_FETCH_TRANSPORT_HTTP_TRANSPORT_H

#include <archive_fetch/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archive_fetch {

/**
 * @brief Default User-Agent sent with every request
 */
inline constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0 Safari/537.36";

/**
 * @brief One ranged GET request
 */
struct range_request {
    std::string url;

    /// Header carrying the session credential, e.g. "Cookie"
    std::string credential_header = "Cookie";
    std::string credential;

    /// First byte requested
    uint64_t range_start = 0;

    /// Last byte requested (inclusive); open-ended when unset
    std::optional<uint64_t> range_end;

    std::chrono::milliseconds timeout{300000};

    std::string user_agent{DEFAULT_USER_AGENT};

    /**
     * @brief Value for the Range header
     * @return "bytes=a-b" / "bytes=a-", or nullopt for a plain full GET
     */
    [[nodiscard]] auto range_header() const -> std::optional<std::string>;

    /**
     * @brief All request headers, credential included
     */
    [[nodiscard]] auto build_headers() const -> std::map<std::string, std::string>;
};

/**
 * @brief Parsed Content-Range header
 *
 * "bytes 100-199/1000" is satisfied with first=100, last=199, total=1000.
 * "bytes *\/1000" (sent with 416) is unsatisfied with total=1000.
 */
struct content_range {
    bool satisfied = false;
    uint64_t first = 0;
    uint64_t last = 0;
    std::optional<uint64_t> total;

    [[nodiscard]] auto length() const noexcept -> uint64_t {
        return satisfied ? last - first + 1 : 0;
    }

    [[nodiscard]] static auto parse(std::string_view value) -> std::optional<content_range>;
};

/**
 * @brief Response to a range_request
 */
struct range_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(std::string_view key) const -> std::optional<std::string>;

    /**
     * @brief Lower-cased media type without parameters, empty if absent
     */
    [[nodiscard]] auto content_type() const -> std::string;

    [[nodiscard]] auto content_length() const -> std::optional<uint64_t>;

    [[nodiscard]] auto content_range() const -> std::optional<archive_fetch::content_range>;

    /**
     * @brief Full resource length as announced by the server
     *
     * From Content-Range for 206/416, from Content-Length for 200.
     */
    [[nodiscard]] auto total_size() const -> std::optional<uint64_t>;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief Abstract HTTP transport
 *
 * Implementations must be safe to call from several workers at once.
 * Network-level failures are reported as errors in the transient range;
 * any HTTP status, including 4xx and 5xx, is a successful fetch.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    [[nodiscard]] virtual auto fetch(const range_request& request) -> result<range_response> = 0;

    /**
     * @brief Transport name for logs
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_TRANSPORT_HTTP_TRANSPORT_H
