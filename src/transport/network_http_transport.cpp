// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file network_http_transport.cpp
 * @brief network_system backed HTTP transport
 */

#include "archive_fetch/transport/network_http_transport.h"

#include "archive_fetch/config/feature_flags.h"
#include "archive_fetch/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace archive_fetch {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> range_response {
        range_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

network_http_transport::network_http_transport(network_http_transport&&) noexcept = default;
auto network_http_transport::operator=(network_http_transport&&) noexcept
    -> network_http_transport& = default;

auto network_http_transport::is_available() noexcept -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
    return true;
#else
    return false;
#endif
}

// ============================================================================
// Fetch
// ============================================================================

auto network_http_transport::fetch(const range_request& request) -> result<range_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_ || !impl_->client) {
        return unexpected(error{error_code::connection_failed, "HTTP client not initialized"});
    }

    auto headers = request.build_headers();
    AF_LOG_TRACE(log_category::transport,
                 "GET " + request.url + " range=" + request.range_header().value_or("none"));

    auto response = impl_->client->get(request.url, {}, headers);
    if (response.is_err()) {
        return unexpected(error{error_code::connection_failed,
                                "HTTP GET request failed: " + request.url});
    }
    return impl::convert_response(response.value());
#else
    (void)request;
    return unexpected(error{error_code::connection_failed,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"});
#endif
}

}  // namespace archive_fetch
