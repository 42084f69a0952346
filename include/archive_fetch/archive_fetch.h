// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file archive_fetch.h
 * @brief Main header for the archive_fetch library
 * @version 0.1.0
 *
 * Include this header to access the whole fetch engine.
 *
 * @code
 * #include <archive_fetch/archive_fetch.h>
 *
 * using namespace archive_fetch;
 *
 * fetch_config config;
 * config.first_url = "https://example.com/export-001.zip";
 * config.credential = "SID=...";
 *
 * auto job = transfer_orchestrator::builder()
 *     .with_config(config)
 *     .with_transport(std::make_shared<network_http_transport>())
 *     .build();
 * @endcode
 */

#ifndef ARCHIVE_FETCH_ARCHIVE_FETCH_H
#define ARCHIVE_FETCH_ARCHIVE_FETCH_H

#include <string>

// Core types
#include "archive_fetch/core/types.h"
#include "archive_fetch/core/transfer_types.h"
#include "archive_fetch/core/logging.h"

// Components
#include "archive_fetch/core/duplicate_scanner.h"
#include "archive_fetch/core/integrity_verifier.h"
#include "archive_fetch/core/job_state_store.h"
#include "archive_fetch/core/progress_tracker.h"
#include "archive_fetch/core/rate_limiter.h"
#include "archive_fetch/core/url_template.h"

// Configuration
#include "archive_fetch/config/config_loader.h"
#include "archive_fetch/config/fetch_config.h"

// Transport
#include "archive_fetch/transport/http_transport.h"
#include "archive_fetch/transport/network_http_transport.h"

// Transfer
#include "archive_fetch/transfer/resumable_transfer.h"
#include "archive_fetch/transfer/transfer_orchestrator.h"

namespace archive_fetch {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_ARCHIVE_FETCH_H
