// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "archive_fetch/core/url_template.h"

#include <charconv>
#include <regex>

namespace archive_fetch {

auto url_template::parse(std::string_view first_url) -> result<url_template> {
    std::string url(first_url);
    if (url.empty()) {
        return unexpected(error{error_code::invalid_url_template, "empty url"});
    }

    url_template tmpl;
    tmpl.source_ = url;

    // Fragments are never sent to the server
    if (auto hash = url.find('#'); hash != std::string::npos) {
        url.erase(hash);
    }

    std::string path = url;
    if (auto q = url.find('?'); q != std::string::npos) {
        tmpl.query_ = url.substr(q);
        path = url.substr(0, q);
    }

    auto scheme_end = path.find("://");
    auto path_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash < path_start) {
        return unexpected(error{error_code::invalid_url_template,
                                "url has no path segment: " + std::string(first_url)});
    }

    tmpl.directory_ = path.substr(0, slash + 1);
    std::string segment = path.substr(slash + 1);

    static const std::regex suffix_pattern(R"(^(.*?)(\d+)((?:\.\w+)+)$)");
    std::smatch match;
    if (!std::regex_match(segment, match, suffix_pattern)) {
        return unexpected(error{error_code::invalid_url_template,
                                "no numeric sequence suffix in '" + segment + "'"});
    }

    tmpl.stem_ = match[1].str();
    std::string digits = match[2].str();
    tmpl.extension_ = match[3].str();
    tmpl.width_ = digits.size();

    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                     tmpl.parsed_index_);
    if (ec != std::errc{}) {
        return unexpected(error{error_code::invalid_url_template,
                                "sequence number out of range: " + digits});
    }

    return tmpl;
}

auto url_template::url_for(uint64_t index) const -> std::string {
    return directory_ + filename_for(index) + query_;
}

auto url_template::filename_for(uint64_t index) const -> std::string {
    return stem_ + pad(index) + extension_;
}

auto url_template::index_of(std::string_view filename) const -> std::optional<uint64_t> {
    if (filename.size() <= stem_.size() + extension_.size() ||
        filename.substr(0, stem_.size()) != stem_ ||
        filename.substr(filename.size() - extension_.size()) != extension_) {
        return std::nullopt;
    }

    auto digits = filename.substr(stem_.size(),
                                  filename.size() - stem_.size() - extension_.size());
    uint64_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return index;
}

auto url_template::pad(uint64_t index) const -> std::string {
    std::string digits = std::to_string(index);
    if (digits.size() < width_) {
        digits.insert(0, width_ - digits.size(), '0');
    }
    return digits;
}

}  // namespace archive_fetch
