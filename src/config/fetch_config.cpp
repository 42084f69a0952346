// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "archive_fetch/config/fetch_config.h"

#include "archive_fetch/core/url_template.h"

namespace archive_fetch {

namespace {

auto invalid(std::string message) -> result<void> {
    return unexpected(error{error_code::config_invalid, std::move(message)});
}

}  // namespace

auto fetch_config::validate() const -> result<void> {
    if (first_url.empty()) {
        return invalid("first URL is required");
    }
    if (auto tmpl = url_template::parse(first_url); !tmpl.has_value()) {
        return unexpected(tmpl.error());
    }
    if (output_directory.empty()) {
        return invalid("output directory is required");
    }
    if (concurrency == 0 || concurrency > 64) {
        return invalid("concurrency must be between 1 and 64");
    }
    if (chunk_size < 4 * 1024 || chunk_size > 64 * 1024 * 1024) {
        return invalid("chunk size must be between 4KB and 64MB");
    }
    if (retry.backoff_multiplier < 1.0) {
        return invalid("backoff multiplier must be at least 1.0");
    }
    if (retry.initial_delay.count() < 0 || retry.max_delay < retry.initial_delay) {
        return invalid("retry delays must satisfy 0 <= initial <= max");
    }
    if (request_timeout.count() <= 0) {
        return invalid("request timeout must be positive");
    }
    if (credential_warning > credential_ttl) {
        return invalid("credential warning threshold exceeds its time-to-live");
    }
    if (eta_window.count() <= 0 || progress_interval.count() <= 0) {
        return invalid("ETA window and progress interval must be positive");
    }
    if (credential_header.empty()) {
        return invalid("credential header name is required");
    }
    return {};
}

auto fetch_config::to_transfer_options() const -> transfer_options {
    transfer_options options;
    options.chunk_size = chunk_size;
    options.resume_enabled = resume_enabled;
    options.verify_enabled = verify_enabled;
    options.retry = retry;
    options.request_timeout = request_timeout;
    options.credential_header = credential_header;
    options.user_agent = user_agent;
    options.min_archive_bytes = min_archive_bytes;
    return options;
}

}  // namespace archive_fetch
