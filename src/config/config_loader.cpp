// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "archive_fetch/config/config_loader.h"

#include "archive_fetch/core/file_utils.h"
#include "archive_fetch/core/logging.h"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace archive_fetch {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto* whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

auto env_value(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto set_env(const std::string& key, const std::string& value) -> bool {
#ifdef _WIN32
    return _putenv_s(key.c_str(), value.c_str()) == 0;
#else
    return setenv(key.c_str(), value.c_str(), 0) == 0;
#endif
}

auto parse_unsigned(const char* name, const std::string& text) -> result<uint64_t> {
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return unexpected(error{error_code::config_invalid,
                                std::string(name) + " is not a non-negative integer: " + text});
    }
    return value;
}

}  // namespace

auto config_loader::parse_env_line(std::string_view line)
    -> std::optional<std::pair<std::string, std::string>> {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }
    if (line.substr(0, 7) == "export ") {
        line = trim(line.substr(7));
    }

    auto equals = line.find('=');
    if (equals == std::string_view::npos || equals == 0) {
        return std::nullopt;
    }

    auto key = trim(line.substr(0, equals));
    auto value = trim(line.substr(equals + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(std::string(key), std::string(value));
}

auto config_loader::load_env_file(const std::filesystem::path& path) -> result<std::size_t> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::size_t{0};
    }

    std::ifstream in(path);
    if (!in) {
        return unexpected(storage_error_from_errno("open " + path.string()));
    }

    std::size_t exported = 0;
    std::string line;
    while (std::getline(in, line)) {
        auto entry = parse_env_line(line);
        if (!entry) {
            continue;
        }
        if (std::getenv(entry->first.c_str()) != nullptr) {
            continue;
        }
        if (!set_env(entry->first, entry->second)) {
            return unexpected(error{error_code::config_invalid,
                                    "cannot export " + entry->first + " from " + path.string()});
        }
        ++exported;
    }

    AF_LOG_DEBUG(log_category::state,
                 "Loaded " + std::to_string(exported) + " variables from " + path.string());
    return exported;
}

auto config_loader::from_environment(fetch_config base) -> result<fetch_config> {
    if (auto cookie = env_value(env_keys::cookie)) {
        base.credential = *cookie;
    }
    if (auto url = env_value(env_keys::url)) {
        base.first_url = *url;
    }
    if (auto output = env_value(env_keys::output_dir)) {
        base.output_directory = *output;
    }
    if (auto count = env_value(env_keys::file_count)) {
        auto parsed = parse_unsigned(env_keys::file_count, *count);
        if (!parsed.has_value()) {
            return unexpected(parsed.error());
        }
        base.file_count = parsed.value();
    }
    if (auto parallel = env_value(env_keys::parallel)) {
        auto parsed = parse_unsigned(env_keys::parallel, *parallel);
        if (!parsed.has_value()) {
            return unexpected(parsed.error());
        }
        base.concurrency = static_cast<std::size_t>(parsed.value());
    }
    if (auto rate = env_value(env_keys::rate_limit)) {
        auto parsed = parse_unsigned(env_keys::rate_limit, *rate);
        if (!parsed.has_value()) {
            return unexpected(parsed.error());
        }
        base.rate_limit = parsed.value();
    }
    return base;
}

}  // namespace archive_fetch
