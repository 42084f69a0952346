// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file resumable_transfer.cpp
 * @brief Implementation of the single-archive fetcher
 */

#include "archive_fetch/transfer/resumable_transfer.h"

#include "archive_fetch/core/file_utils.h"
#include "archive_fetch/core/logging.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <span>

namespace archive_fetch {

namespace {

auto as_bytes_span(const std::vector<uint8_t>& body) -> std::span<const std::byte> {
    return std::as_bytes(std::span<const uint8_t>(body.data(), body.size()));
}

auto http_error(error_code code, int status) -> error {
    return error{code, "HTTP " + std::to_string(status) + " (" +
                           std::string(to_string(code)) + ")"};
}

}  // namespace

// ============================================================================
// retry_policy
// ============================================================================

auto retry_policy::delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    double delay = static_cast<double>(initial_delay.count()) *
                   std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
    delay = std::min(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

// ============================================================================
// attempt: state of one run()
// ============================================================================

class resumable_transfer::attempt {
public:
    attempt(resumable_transfer& owner, const file_task& task,
            const session_credential& credential, stop_signal& stop,
            const progress_callback& on_progress)
        : owner_(owner),
          task_(task),
          credential_(credential),
          stop_(stop),
          on_progress_(on_progress),
          expected_(task.expected_size) {
        result_.index = task.index;
        result_.credential_generation = credential.generation;
    }

    auto run() -> transfer_result {
        log(log_level::debug, "Starting transfer");

        if (auto prepared = prepare_partial(); !prepared.has_value()) {
            return finish(transfer_outcome::storage_failure, prepared.error());
        }

        if (expected_ && offset_ >= *expected_) {
            return finalize();
        }

        std::size_t consecutive_failures = 0;
        while (true) {
            if (stop_.stop_requested()) {
                return finish(transfer_outcome::interrupted, {});
            }

            switch (fetch_window()) {
                case step::progressed:
                    consecutive_failures = 0;
                    break;

                case step::complete:
                    return finalize();

                case step::transient: {
                    ++consecutive_failures;
                    ++result_.network_retries;
                    const auto& policy = owner_.options_.retry;
                    if (consecutive_failures > policy.max_retries) {
                        log(log_level::error, "Giving up after " +
                                                  std::to_string(policy.max_retries) + " retries");
                        return finish(transfer_outcome::failed, pending_error_);
                    }
                    auto delay = policy.delay_for(consecutive_failures);
                    log(log_level::warn, "Transient failure, retry " +
                                             std::to_string(consecutive_failures) + " in " +
                                             std::to_string(delay.count()) + "ms");
                    if (!stop_.wait_for(delay)) {
                        return finish(transfer_outcome::interrupted, {});
                    }
                    break;
                }

                case step::terminal:
                    return finish(terminal_outcome_, pending_error_);
            }
        }
    }

private:
    enum class step { progressed, complete, transient, terminal };

    // ========================================================================
    // Partial file handling
    // ========================================================================

    auto prepare_partial() -> result<void> {
        const auto& options = owner_.options_;
        offset_ = 0;

        if (auto size = regular_file_size(task_.partial_path)) {
            bool keep = options.resume_enabled;
            if (keep && expected_ && *size > *expected_) {
                log(log_level::warn, "Partial file exceeds expected size, discarding");
                keep = false;
            }
            if (keep && *size > 0 && options.verify_enabled) {
                auto verdict = owner_.verifier_.verify_prefix(task_.partial_path);
                if (!verdict.has_value()) {
                    return unexpected(verdict.error());
                }
                if (verdict.value() != integrity_verdict::valid) {
                    log(log_level::warn,
                        "Partial file does not start like an archive, discarding");
                    keep = false;
                }
            }
            if (keep) {
                offset_ = *size;
            }
            return open_output(!keep);
        }

        return open_output(true);
    }

    auto open_output(bool truncate) -> result<void> {
        if (out_.is_open()) {
            out_.close();
        }
        auto mode = std::ios::binary | std::ios::out | (truncate ? std::ios::trunc : std::ios::app);
        out_.open(task_.partial_path, mode);
        if (!out_) {
            return unexpected(
                storage_error_from_errno("cannot open " + task_.partial_path.string()));
        }
        return {};
    }

    auto restart_from_zero(const std::string& reason) -> result<void> {
        log(log_level::warn, "Restarting from offset 0: " + reason);
        offset_ = 0;
        if (auto opened = open_output(true); !opened.has_value()) {
            return opened;
        }
        report({.index = task_.index,
                .bytes = 0,
                .bytes_confirmed = 0,
                .expected_size = expected_,
                .restarted = true});
        return {};
    }

    auto append(const std::vector<uint8_t>& body) -> result<void> {
        out_.write(reinterpret_cast<const char*>(body.data()),
                   static_cast<std::streamsize>(body.size()));
        out_.flush();
        if (!out_) {
            return unexpected(
                storage_error_from_errno("cannot write " + task_.partial_path.string()));
        }
        offset_ += body.size();
        report({.index = task_.index,
                .bytes = body.size(),
                .bytes_confirmed = offset_,
                .expected_size = expected_});
        return {};
    }

    /**
     * @brief Debit the rate budget and append one chunk
     */
    auto write_chunk(const std::vector<uint8_t>& body) -> bool {
        if (!owner_.limiter_.acquire(body.size())) {
            terminal_outcome_ = transfer_outcome::interrupted;
            pending_error_ = {};
            return false;
        }
        if (auto written = append(body); !written.has_value()) {
            terminal_outcome_ = transfer_outcome::storage_failure;
            pending_error_ = written.error();
            return false;
        }
        return true;
    }

    // ========================================================================
    // One range request
    // ========================================================================

    auto fetch_window() -> step {
        const auto& options = owner_.options_;

        range_request request;
        request.url = task_.url;
        request.credential_header = options.credential_header;
        request.credential = credential_.token;
        request.range_start = offset_;
        uint64_t window_end = offset_ + std::max<std::size_t>(options.chunk_size, 1) - 1;
        if (expected_ && *expected_ > 0) {
            window_end = std::min(window_end, *expected_ - 1);
        }
        request.range_end = window_end;
        request.timeout = options.request_timeout;
        request.user_agent = options.user_agent;

        auto response = owner_.transport_.fetch(request);
        if (!response.has_value()) {
            pending_error_ = response.error();
            if (is_transient(response.error().code)) {
                return step::transient;
            }
            return terminal(transfer_outcome::failed, response.error());
        }

        const auto& resp = response.value();
        auto code = classify_status(resp.status_code);
        switch (code) {
            case error_code::success:
                break;
            case error_code::auth_failure:
                return terminal(transfer_outcome::auth_failure, http_error(code, resp.status_code));
            case error_code::remote_not_found:
                return terminal(transfer_outcome::not_found, http_error(code, resp.status_code));
            case error_code::range_not_satisfiable:
                return handle_unsatisfiable(resp);
            case error_code::remote_server_error:
                pending_error_ = http_error(code, resp.status_code);
                return step::transient;
            default:
                return terminal(transfer_outcome::failed, http_error(code, resp.status_code));
        }

        auto content_type = resp.content_type();
        if (integrity_verifier::is_markup_content_type(content_type)) {
            return terminal(transfer_outcome::auth_failure,
                            error{error_code::auth_failure,
                                  "remote served " + content_type + " instead of an archive"});
        }

        if (resp.status_code == 200) {
            return handle_full_body(resp);
        }
        return handle_partial_body(resp, window_end - offset_ + 1);
    }

    auto handle_unsatisfiable(const range_response& resp) -> step {
        auto total = resp.total_size();
        if (offset_ > 0 && (!total || *total == offset_)) {
            // Everything was already received before the last interruption
            expected_ = offset_;
            return step::complete;
        }
        if (offset_ == 0) {
            return terminal(transfer_outcome::failed,
                            http_error(error_code::range_not_satisfiable, resp.status_code));
        }
        expected_ = total;
        if (auto restarted = restart_from_zero("range not satisfiable"); !restarted.has_value()) {
            return terminal(transfer_outcome::storage_failure, restarted.error());
        }
        return step::progressed;
    }

    auto handle_full_body(const range_response& resp) -> step {
        const auto& body = resp.body;
        if (body.empty()) {
            pending_error_ = error{error_code::invalid_response, "empty response body"};
            return step::transient;
        }
        // Classify before touching the partial so confirmed bytes survive an error page
        if (integrity_verifier::classify_prefix(as_bytes_span(body)) !=
            integrity_verdict::valid) {
            return terminal(transfer_outcome::auth_failure,
                            error{error_code::auth_failure,
                                  "remote served " +
                                      integrity_verifier::describe_payload(as_bytes_span(body))});
        }

        if (offset_ > 0) {
            if (auto restarted = restart_from_zero("server ignored the range request");
                !restarted.has_value()) {
                return terminal(transfer_outcome::storage_failure, restarted.error());
            }
        }

        auto announced = resp.content_length();
        if (announced) {
            expected_ = announced;
        }

        if (!write_chunk(body)) {
            return step::terminal;
        }

        if (announced && offset_ < *announced) {
            pending_error_ = error{error_code::connection_reset,
                                   "body truncated at " + std::to_string(offset_) + " of " +
                                       std::to_string(*announced) + " bytes"};
            return step::transient;
        }
        expected_ = offset_;
        return step::complete;
    }

    auto handle_partial_body(const range_response& resp, uint64_t requested) -> step {
        auto range = resp.content_range();
        if (!range || !range->satisfied) {
            pending_error_ = error{error_code::invalid_response, "206 without a usable Content-Range"};
            return step::transient;
        }
        if (range->first != offset_) {
            pending_error_ = error{error_code::invalid_response,
                                   "range starts at " + std::to_string(range->first) +
                                       ", expected " + std::to_string(offset_)};
            return step::transient;
        }

        if (range->total) {
            if (expected_ && *expected_ != *range->total) {
                expected_ = range->total;
                if (auto restarted = restart_from_zero("remote file size changed");
                    !restarted.has_value()) {
                    return terminal(transfer_outcome::storage_failure, restarted.error());
                }
                return step::progressed;
            }
            expected_ = range->total;
        }

        const auto& body = resp.body;
        if (body.empty()) {
            pending_error_ = error{error_code::invalid_response, "empty range body"};
            return step::transient;
        }
        if (body.size() > range->length()) {
            pending_error_ = error{error_code::invalid_response,
                                   "body longer than its Content-Range"};
            return step::transient;
        }
        if (offset_ == 0 && integrity_verifier::classify_prefix(as_bytes_span(body)) !=
                                integrity_verdict::valid) {
            return terminal(transfer_outcome::auth_failure,
                            error{error_code::auth_failure,
                                  "remote served " +
                                      integrity_verifier::describe_payload(as_bytes_span(body))});
        }

        if (!write_chunk(body)) {
            return step::terminal;
        }

        if (expected_ && offset_ >= *expected_) {
            return step::complete;
        }
        if (!expected_ && body.size() < requested) {
            expected_ = offset_;
            return step::complete;
        }
        return step::progressed;
    }

    // ========================================================================
    // Completion
    // ========================================================================

    auto finalize() -> transfer_result {
        const auto& options = owner_.options_;

        out_.close();
        if (out_.fail()) {
            return finish(transfer_outcome::storage_failure,
                          storage_error_from_errno("cannot close " + task_.partial_path.string()));
        }
        if (!expected_) {
            expected_ = offset_;
        }

        report({.index = task_.index,
                .bytes = 0,
                .bytes_confirmed = offset_,
                .expected_size = expected_,
                .verifying = true});

        if (options.min_archive_bytes > 0 && offset_ < options.min_archive_bytes) {
            discard_partial();
            return finish(transfer_outcome::auth_failure,
                          error{error_code::auth_failure,
                                "completed file is only " + std::to_string(offset_) + " bytes"});
        }

        if (options.verify_enabled) {
            auto report = owner_.verifier_.verify_file(task_.partial_path);
            if (!report.has_value()) {
                return finish(transfer_outcome::storage_failure, report.error());
            }
            switch (report.value().verdict) {
                case integrity_verdict::valid:
                    break;
                case integrity_verdict::auth_failure:
                    discard_partial();
                    return finish(transfer_outcome::auth_failure,
                                  error{error_code::auth_failure, report.value().reason});
                case integrity_verdict::corrupt:
                    discard_partial();
                    return finish(transfer_outcome::corrupt,
                                  error{error_code::corrupt_file, report.value().reason});
            }
        }

        std::error_code ec;
        std::filesystem::rename(task_.partial_path, task_.final_path, ec);
        if (ec) {
            return finish(transfer_outcome::storage_failure,
                          storage_error("cannot rename " + task_.partial_path.string(), ec));
        }

        log(log_level::info, "Transfer complete");
        return finish(transfer_outcome::completed, {});
    }

    void discard_partial() {
        std::error_code ec;
        std::filesystem::remove(task_.partial_path, ec);
        if (ec) {
            AF_LOG_WARN(log_category::transfer,
                        "Could not remove " + task_.partial_path.string() + ": " + ec.message());
        }
        offset_ = 0;
    }

    auto terminal(transfer_outcome outcome, error err) -> step {
        terminal_outcome_ = outcome;
        pending_error_ = std::move(err);
        return step::terminal;
    }

    auto finish(transfer_outcome outcome, error err) -> transfer_result {
        if (out_.is_open()) {
            out_.close();
        }
        result_.outcome = outcome;
        result_.bytes_confirmed = offset_;
        result_.expected_size = expected_;
        result_.err = std::move(err);
        if (outcome != transfer_outcome::completed && outcome != transfer_outcome::interrupted) {
            auto ctx = context();
            ctx.error_message = result_.err.message;
            AF_LOG_WARN_CTX(log_category::transfer,
                            "Transfer ended: " + std::string(to_string(outcome)), ctx);
        }
        return result_;
    }

    void log(log_level level, const std::string& message) const {
        auto ctx = context();
        AF_LOG_CTX(level, log_category::transfer, message, ctx);
    }

    void report(const transfer_delta& delta) {
        if (on_progress_) {
            on_progress_(delta);
        }
    }

    auto context() const -> fetch_log_context {
        fetch_log_context ctx;
        ctx.sequence_index = task_.index;
        ctx.filename = task_.filename();
        ctx.bytes_confirmed = offset_;
        ctx.expected_size = expected_;
        ctx.retry_count = static_cast<uint32_t>(result_.network_retries);
        return ctx;
    }

    resumable_transfer& owner_;
    const file_task& task_;
    const session_credential& credential_;
    stop_signal& stop_;
    const progress_callback& on_progress_;

    std::ofstream out_;
    uint64_t offset_ = 0;
    std::optional<uint64_t> expected_;
    transfer_outcome terminal_outcome_ = transfer_outcome::failed;
    error pending_error_;
    transfer_result result_;
};

// ============================================================================
// resumable_transfer
// ============================================================================

resumable_transfer::resumable_transfer(http_transport& transport, rate_limiter& limiter,
                                       transfer_options options)
    : transport_(transport),
      limiter_(limiter),
      options_(std::move(options)),
      verifier_(options_.verification) {}

auto resumable_transfer::run(const file_task& task, const session_credential& credential,
                             stop_signal& stop, const progress_callback& on_progress)
    -> transfer_result {
    attempt current(*this, task, credential, stop, on_progress);
    return current.run();
}

auto resumable_transfer::classify_status(int status_code) -> error_code {
    switch (status_code) {
        case 200:
        case 206:
            return error_code::success;
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            // Expired sessions are redirected to a sign-in page
            return error_code::auth_failure;
        case 401:
        case 403:
            return error_code::auth_failure;
        case 404:
        case 410:
            return error_code::remote_not_found;
        case 416:
            return error_code::range_not_satisfiable;
        case 408:
        case 429:
            return error_code::remote_server_error;
        default:
            break;
    }
    if (status_code >= 500 && status_code < 600) {
        return error_code::remote_server_error;
    }
    if (status_code >= 400 && status_code < 500) {
        return error_code::remote_rejected;
    }
    return error_code::invalid_response;
}

}  // namespace archive_fetch
