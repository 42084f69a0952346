// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <archive_fetch/config/feature_flags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace archive_fetch {

/**
 * @brief Log categories for archive_fetch
 */
struct log_category {
    static constexpr std::string_view rate_limiter = "archive_fetch.rate_limiter";
    static constexpr std::string_view verifier = "archive_fetch.verifier";
    static constexpr std::string_view transfer = "archive_fetch.transfer";
    static constexpr std::string_view state = "archive_fetch.state";
    static constexpr std::string_view orchestrator = "archive_fetch.orchestrator";
    static constexpr std::string_view transport = "archive_fetch.transport";
    static constexpr std::string_view dedupe = "archive_fetch.dedupe";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

[[nodiscard]] inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Secrets (session credentials) are masked by default. Paths are opt-in.
 */
struct masking_config {
    bool mask_secrets = true;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config secrets_only() {
        return {true, false, "*", 4};
    }
};

/**
 * @brief Masks session credentials and paths in log messages
 *
 * Registered secrets are replaced wherever they occur. Cookie and
 * Authorization header values are masked even when not registered.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::secrets_only())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;

        if (config_.mask_secrets) {
            for (const auto& secret : secrets_) {
                result = replace_all(result, secret, mask_secret(secret));
            }
            result = mask_header_values(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask a credential, keeping only a short prefix
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (secret.empty()) {
            return secret;
        }
        auto visible = std::min(config_.visible_chars, secret.size() / 4);
        return secret.substr(0, visible) +
               std::string(secret.size() - visible, config_.mask_char[0]);
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        return std::string(last_sep, config_.mask_char[0]) + path.substr(last_sep);
    }

    /**
     * @brief Register a value that must never appear in clear text
     */
    void add_secret(std::string secret) {
        if (secret.size() < 4) {
            return;
        }
        if (std::find(secrets_.begin(), secrets_.end(), secret) == secrets_.end()) {
            secrets_.push_back(std::move(secret));
        }
    }

    void clear_secrets() { secrets_.clear(); }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] static auto replace_all(std::string input,
                                          const std::string& from,
                                          const std::string& to) -> std::string {
        size_t pos = 0;
        while ((pos = input.find(from, pos)) != std::string::npos) {
            input.replace(pos, from.size(), to);
            pos += to.size();
        }
        return input;
    }

    [[nodiscard]] auto mask_header_values(const std::string& input) const -> std::string {
        static const std::regex header_pattern(
            R"(((?:[Cc]ookie|[Aa]uthorization)\s*[:=]\s*)([^\s,;]+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), header_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            result += input.substr(last_pos, match.position() - last_pos);
            result += match[1].str();
            result += mask_secret(match[2].str());
            last_pos = match.position() + match.length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
    std::vector<std::string> secrets_;
};

/**
 * @brief Structured log context for a single archive fetch
 */
struct fetch_log_context {
    std::optional<uint64_t> sequence_index;
    std::string filename;
    std::optional<uint64_t> bytes_confirmed;
    std::optional<uint64_t> expected_size;
    std::optional<uint32_t> retry_count;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<int> http_status;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto separator = [&]() {
            if (!first) oss << ",";
            first = false;
        };
        auto add_field = [&](const char* name, const std::string& value) {
            separator();
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
        };
        auto add_int = [&](const char* name, int64_t value) {
            separator();
            oss << "\"" << name << "\":" << value;
        };

        if (sequence_index) add_int("index", static_cast<int64_t>(*sequence_index));
        if (!filename.empty()) add_field("filename", filename);
        if (bytes_confirmed) add_int("bytes_confirmed", static_cast<int64_t>(*bytes_confirmed));
        if (expected_size) add_int("expected_size", static_cast<int64_t>(*expected_size));
        if (retry_count) add_int("retry_count", *retry_count);
        if (rate_mbps) {
            separator();
            oss << std::fixed << std::setprecision(2)
                << "\"rate_mbps\":" << *rate_mbps;
        }
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));
        if (http_status) add_int("http_status", *http_status);
        if (error_message) {
            add_field("error_message",
                      masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<fetch_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\""
                << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for archive_fetch
 *
 * Routes to kcenon logger_system when available, otherwise writes to
 * stderr. Every message passes through the masker first.
 */
class archive_fetch_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view,
                                            std::string_view,
                                            const fetch_log_context*)>;

    archive_fetch_logger() = default;
    ~archive_fetch_logger() = default;

    archive_fetch_logger(const archive_fetch_logger&) = delete;
    archive_fetch_logger& operator=(const archive_fetch_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; later calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Register a session credential so it is masked in all output
     */
    void register_secret(std::string secret) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.add_secret(std::move(secret));
    }

    /**
     * @brief Apply the current masking rules to a string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.mask(input);
    }

    /**
     * @brief Set a callback receiving every enabled entry (already masked)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output (callbacks still fire)
     */
    void set_console_output(bool enable) { console_output_.store(enable); }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const fetch_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            rendered = entry.to_json(&current_masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masked;
            if (context) {
                oss << " " << context->to_json(&current_masker);
            }
            rendered = oss.str();
        }

        emit(level, rendered, format);
    }

    void flush() {
#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level, const std::string& rendered,
              log_output_format format) {
        if (!console_output_.load()) {
            return;
        }

#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), rendered);
            return;
        }
#endif

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        if (format == log_output_format::json) {
            std::cerr << rendered << "\n";
        } else {
            std::cerr << get_local_timestamp() << " ["
                      << log_level_to_string(level) << "] " << rendered << "\n";
        }
    }

#if ARCHIVE_FETCH_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    static auto get_local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline archive_fetch_logger& get_logger() {
    static archive_fetch_logger instance;
    return instance;
}

// Logging macros for convenience
#define AF_LOG(level, category, message) \
    archive_fetch::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define AF_LOG_CTX(level, category, message, context) \
    archive_fetch::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define AF_LOG_TRACE(category, message) \
    AF_LOG(archive_fetch::log_level::trace, category, message)

#define AF_LOG_DEBUG(category, message) \
    AF_LOG(archive_fetch::log_level::debug, category, message)

#define AF_LOG_INFO(category, message) \
    AF_LOG(archive_fetch::log_level::info, category, message)

#define AF_LOG_WARN(category, message) \
    AF_LOG(archive_fetch::log_level::warn, category, message)

#define AF_LOG_ERROR(category, message) \
    AF_LOG(archive_fetch::log_level::error, category, message)

#define AF_LOG_DEBUG_CTX(category, message, ctx) \
    AF_LOG_CTX(archive_fetch::log_level::debug, category, message, ctx)

#define AF_LOG_INFO_CTX(category, message, ctx) \
    AF_LOG_CTX(archive_fetch::log_level::info, category, message, ctx)

#define AF_LOG_WARN_CTX(category, message, ctx) \
    AF_LOG_CTX(archive_fetch::log_level::warn, category, message, ctx)

#define AF_LOG_ERROR_CTX(category, message, ctx) \
    AF_LOG_CTX(archive_fetch::log_level::error, category, message, ctx)

}  // namespace archive_fetch
