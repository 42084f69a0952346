// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file http_transport.cpp
 * @brief Range request and response helpers
 */

#include "archive_fetch/transport/http_transport.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace archive_fetch {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_number(std::string_view text) -> std::optional<uint64_t> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ============================================================================
// range_request
// ============================================================================

auto range_request::range_header() const -> std::optional<std::string> {
    if (range_start == 0 && !range_end) {
        return std::nullopt;
    }
    std::string value = "bytes=" + std::to_string(range_start) + "-";
    if (range_end) {
        value += std::to_string(*range_end);
    }
    return value;
}

auto range_request::build_headers() const -> std::map<std::string, std::string> {
    std::map<std::string, std::string> headers;
    headers["User-Agent"] = user_agent;
    // Compressed transfer encodings would break byte offsets
    headers["Accept-Encoding"] = "identity";
    headers["Accept"] = "*/*";
    if (!credential.empty()) {
        headers[credential_header] = credential;
    }
    if (auto range = range_header()) {
        headers["Range"] = *range;
    }
    return headers;
}

// ============================================================================
// content_range
// ============================================================================

auto content_range::parse(std::string_view value) -> std::optional<content_range> {
    value = trim(value);
    constexpr std::string_view unit = "bytes";
    if (value.size() <= unit.size() || to_lower(value.substr(0, unit.size())) != unit) {
        return std::nullopt;
    }
    value = trim(value.substr(unit.size()));

    auto slash = value.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    auto span_part = trim(value.substr(0, slash));
    auto total_part = trim(value.substr(slash + 1));

    content_range range;
    if (total_part != "*") {
        range.total = parse_number(total_part);
        if (!range.total) {
            return std::nullopt;
        }
    }

    if (span_part == "*") {
        if (!range.total) {
            return std::nullopt;
        }
        return range;
    }

    auto dash = span_part.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto first = parse_number(span_part.substr(0, dash));
    auto last = parse_number(span_part.substr(dash + 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }
    if (range.total && *last >= *range.total) {
        return std::nullopt;
    }

    range.satisfied = true;
    range.first = *first;
    range.last = *last;
    return range;
}

// ============================================================================
// range_response
// ============================================================================

auto range_response::get_header(std::string_view key) const -> std::optional<std::string> {
    if (auto it = headers.find(std::string(key)); it != headers.end()) {
        return it->second;
    }

    auto lower_key = to_lower(key);
    for (const auto& [k, v] : headers) {
        if (to_lower(k) == lower_key) {
            return v;
        }
    }
    return std::nullopt;
}

auto range_response::content_type() const -> std::string {
    auto value = get_header("Content-Type");
    if (!value) {
        return {};
    }
    std::string_view media(*value);
    if (auto semicolon = media.find(';'); semicolon != std::string_view::npos) {
        media = media.substr(0, semicolon);
    }
    return to_lower(trim(media));
}

auto range_response::content_length() const -> std::optional<uint64_t> {
    auto value = get_header("Content-Length");
    if (!value) {
        return std::nullopt;
    }
    return parse_number(*value);
}

auto range_response::content_range() const -> std::optional<archive_fetch::content_range> {
    auto value = get_header("Content-Range");
    if (!value) {
        return std::nullopt;
    }
    return archive_fetch::content_range::parse(*value);
}

auto range_response::total_size() const -> std::optional<uint64_t> {
    if (status_code == 206 || status_code == 416) {
        auto range = content_range();
        return range ? range->total : std::nullopt;
    }
    if (status_code == 200) {
        if (auto length = content_length()) {
            return length;
        }
        return static_cast<uint64_t>(body.size());
    }
    return std::nullopt;
}

}  // namespace archive_fetch
