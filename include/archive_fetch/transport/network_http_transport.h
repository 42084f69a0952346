// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file network_http_transport.h
 * @brief http_transport backed by network_system's HTTP client
 * @version 0.1.0
 */

#ifndef ARCHIVE_FETCH_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
#define ARCHIVE_FETCH_TRANSPORT_NETWORK_HTTP_TRANSPORT_H

#include "http_transport.h"

#include <chrono>
#include <memory>

namespace archive_fetch {

/**
 * @brief Production HTTP transport
 *
 * Wraps kcenon::network::core::http_client. When the library was built
 * without network_system every fetch fails with connection_failed.
 *
 * @note The client timeout is fixed at construction; range_request::timeout
 *       is not applied per call.
 */
class network_http_transport : public http_transport {
public:
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(300000));

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;
    network_http_transport(network_http_transport&&) noexcept;
    auto operator=(network_http_transport&&) noexcept -> network_http_transport&;

    [[nodiscard]] auto fetch(const range_request& request) -> result<range_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "network_system"; }

    /**
     * @brief Check if a real HTTP client is compiled in
     */
    [[nodiscard]] static auto is_available() noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
