// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file job_state_store.cpp
 * @brief Implementation of job_state_store
 */

#include <archive_fetch/core/job_state_store.h>

#include <archive_fetch/core/file_utils.h>
#include <archive_fetch/core/logging.h>

#include <algorithm>
#include <charconv>
#include <mutex>
#include <sstream>

namespace archive_fetch {

// ============================================================================
// JSON serialization helpers (flat records only)
// ============================================================================

namespace {

auto unescape_json_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            result += s[i];
            continue;
        }
        switch (s[++i]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u':
                if (i + 4 < s.size()) {
                    unsigned int code = 0;
                    auto [ptr, ec] = std::from_chars(s.data() + i + 1, s.data() + i + 5,
                                                     code, 16);
                    if (ec == std::errc{} && code < 0x80) {
                        result += static_cast<char>(code);
                    }
                    i += 4;
                }
                break;
            default: result += s[i]; break;
        }
    }
    return result;
}

/**
 * @brief Raw text of a top-level value, or nullopt when the key is absent
 *
 * String values are returned without quotes and still escaped.
 */
auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto key_pos = json.find("\"" + key + "\"");
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    auto colon_pos = json.find(':', key_pos + key.size() + 2);
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    auto value_start = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        auto string_end = value_start + 1;
        while (string_end < json.size()) {
            if (json[string_end] == '\\') {
                string_end += 2;
                continue;
            }
            if (json[string_end] == '"') {
                return json.substr(value_start + 1, string_end - value_start - 1);
            }
            ++string_end;
        }
        return std::nullopt;
    }

    auto value_end = json.find_first_of(",}\r\n", value_start);
    if (value_end == std::string::npos) {
        return std::nullopt;
    }
    auto value = json.substr(value_start, value_end - value_start);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    return value;
}

auto parse_uint(const std::optional<std::string>& text) -> std::optional<uint64_t> {
    if (!text || text->empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        return std::nullopt;
    }
    return value;
}

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

auto serialize_task(const file_task& task) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"index\": " << task.index << ",\n";
    oss << "  \"filename\": \"" << detail::escape_json_string(task.filename()) << "\",\n";
    oss << "  \"url\": \"" << detail::escape_json_string(task.url) << "\",\n";
    oss << "  \"status\": \"" << to_string(task.status) << "\",\n";
    if (task.expected_size) {
        oss << "  \"expected_size\": " << *task.expected_size << ",\n";
    }
    oss << "  \"bytes_confirmed\": " << task.bytes_confirmed << ",\n";
    oss << "  \"retry_count\": " << task.retry_count << ",\n";
    if (!task.last_error.empty()) {
        oss << "  \"last_error\": \"" << detail::escape_json_string(task.last_error) << "\",\n";
    }
    oss << "  \"updated_at\": " << now_ms() << "\n";
    oss << "}\n";
    return oss.str();
}

auto serialize_manifest(const job_manifest& manifest) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"first_url\": \"" << detail::escape_json_string(manifest.first_url) << "\"";
    if (manifest.file_count) {
        oss << ",\n  \"file_count\": " << *manifest.file_count;
    }
    if (manifest.discovered_end) {
        oss << ",\n  \"discovered_end\": " << *manifest.discovered_end;
    }
    oss << "\n}\n";
    return oss.str();
}

}  // namespace

// ============================================================================
// job_state_store::impl
// ============================================================================

class job_state_store::impl {
public:
    impl(std::filesystem::path dir, verifier_options verification)
        : directory_(std::move(dir))
        , verifier_(verification) {}

    auto prepare() -> result<void> {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            return unexpected(storage_error("cannot create " + directory_.string(), ec));
        }
        return {};
    }

    auto make_task(const url_template& tmpl, uint64_t index) const -> file_task {
        file_task task;
        task.index = index;
        task.url = tmpl.url_for(index);
        task.final_path = directory_ / tmpl.filename_for(index);
        task.partial_path = task.final_path;
        task.partial_path += PARTIAL_EXTENSION;
        return task;
    }

    auto progress_path(const file_task& task) const -> std::filesystem::path {
        auto path = task.final_path;
        path += PROGRESS_EXTENSION;
        return path;
    }

    auto read_record(const file_task& task) const -> result<file_task> {
        auto path = progress_path(task);
        if (!regular_file_size(path)) {
            return unexpected(error{error_code::state_not_found,
                                    "no sidecar for " + task.filename()});
        }

        auto content = read_text_file(path);
        if (!content) {
            return unexpected(content.error());
        }
        const auto& json = content.value();

        auto index = parse_uint(extract_json_value(json, "index"));
        auto status_text = extract_json_value(json, "status");
        auto status = status_text ? task_status_from_string(*status_text) : std::nullopt;
        auto bytes = parse_uint(extract_json_value(json, "bytes_confirmed"));
        if (!index || !status || !bytes || *index != task.index) {
            return unexpected(error{error_code::state_corrupted,
                                    "unreadable sidecar " + path.filename().string()});
        }

        file_task recorded = task;
        recorded.status = *status;
        recorded.bytes_confirmed = *bytes;
        recorded.expected_size = parse_uint(extract_json_value(json, "expected_size"));
        recorded.retry_count = static_cast<uint32_t>(
            parse_uint(extract_json_value(json, "retry_count")).value_or(0));
        if (auto err = extract_json_value(json, "last_error")) {
            recorded.last_error = unescape_json_string(*err);
        }
        return recorded;
    }

    auto record(const file_task& task) -> result<void> {
        auto written = write_file_atomically(progress_path(task), serialize_task(task));
        if (!written) {
            AF_LOG_ERROR(log_category::state,
                         "Failed to persist " + task.filename() + ": " +
                         written.error().message);
            return written;
        }
        AF_LOG_TRACE(log_category::state,
                     "Recorded " + task.filename() + " as " +
                     std::string(to_string(task.status)));
        return {};
    }

    auto load_task(const url_template& tmpl, uint64_t index, const load_options& options)
        -> result<file_task> {
        file_task task = make_task(tmpl, index);

        std::optional<file_task> recorded;
        auto sidecar = read_record(task);
        if (sidecar) {
            recorded = sidecar.value();
            task.expected_size = recorded->expected_size;
            task.last_error = recorded->last_error;
        } else if (sidecar.error().code != error_code::state_not_found) {
            AF_LOG_WARN(log_category::state,
                        "Ignoring sidecar: " + sidecar.error().message);
        }

        std::error_code ec;
        if (auto final_size = regular_file_size(task.final_path)) {
            bool vouched = recorded && recorded->status == task_status::done &&
                           (!recorded->expected_size ||
                            *recorded->expected_size == *final_size);

            bool keep = true;
            if (!vouched && options.verify_completed) {
                auto report = verifier_.verify_file(task.final_path);
                if (!report) {
                    return unexpected(report.error());
                }
                if (!report.value().is_valid()) {
                    AF_LOG_WARN(log_category::state,
                                task.filename() + " failed verification (" +
                                report.value().reason + "), fetching again");
                    std::filesystem::remove(task.final_path, ec);
                    if (ec) {
                        return unexpected(storage_error("cannot remove " +
                                                        task.final_path.string(), ec));
                    }
                    task.expected_size.reset();
                    keep = false;
                }
            }

            if (keep) {
                task.status = task_status::done;
                task.bytes_confirmed = *final_size;
                task.expected_size = *final_size;
                task.last_error.clear();
                std::filesystem::remove(task.partial_path, ec);
                return task;
            }
        } else if (recorded && recorded->status == task_status::done) {
            AF_LOG_WARN(log_category::state,
                        task.filename() + " was recorded done but is missing");
            task.expected_size.reset();
        }

        task.status = task_status::pending;
        task.retry_count = 0;

        if (auto partial_size = regular_file_size(task.partial_path)) {
            bool discard = !options.resume_enabled ||
                           (task.expected_size && *partial_size > *task.expected_size);
            if (discard) {
                std::filesystem::remove(task.partial_path, ec);
                if (ec) {
                    return unexpected(storage_error("cannot remove " +
                                                    task.partial_path.string(), ec));
                }
                task.bytes_confirmed = 0;
            } else {
                task.bytes_confirmed = *partial_size;
                AF_LOG_DEBUG(log_category::state,
                             "Resumable " + task.filename() + " at byte " +
                             std::to_string(*partial_size));
            }
        } else {
            task.bytes_confirmed = 0;
        }

        return task;
    }

    auto highest_index_on_disk(const url_template& tmpl) const -> uint64_t {
        uint64_t highest = 0;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::string name = it->path().filename().string();
            for (auto ext : {PARTIAL_EXTENSION, PROGRESS_EXTENSION}) {
                if (name.size() > ext.size() &&
                    name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
                    name.erase(name.size() - ext.size());
                    break;
                }
            }
            if (auto index = tmpl.index_of(name)) {
                highest = std::max(highest, *index);
            }
        }
        return highest;
    }

    auto load(const url_template& tmpl, const load_options& options)
        -> result<std::vector<file_task>> {
        uint64_t last = 0;
        if (options.file_count) {
            last = *options.file_count;
        } else {
            last = highest_index_on_disk(tmpl);
            auto manifest = load_manifest();
            if (manifest && manifest.value().first_url == tmpl.source() &&
                manifest.value().discovered_end) {
                last = std::max(last, *manifest.value().discovered_end);
            }
        }

        std::vector<file_task> tasks;
        tasks.reserve(static_cast<std::size_t>(last));
        std::size_t done = 0;
        std::size_t resumable = 0;
        for (uint64_t index = 1; index <= last; ++index) {
            auto task = load_task(tmpl, index, options);
            if (!task) {
                return unexpected(task.error());
            }
            if (task.value().status == task_status::done) {
                ++done;
            } else if (task.value().bytes_confirmed > 0) {
                ++resumable;
            }
            tasks.push_back(std::move(task.value()));
        }

        AF_LOG_INFO(log_category::state,
                    "Loaded " + std::to_string(tasks.size()) + " tasks (" +
                    std::to_string(done) + " done, " + std::to_string(resumable) +
                    " resumable)");
        return tasks;
    }

    auto forget(const file_task& task) -> result<void> {
        for (const auto& path : {task.final_path, task.partial_path, progress_path(task)}) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                return unexpected(storage_error("cannot remove " + path.string(), ec));
            }
        }
        return {};
    }

    auto load_manifest() const -> result<job_manifest> {
        auto path = directory_ / MANIFEST_FILENAME;
        if (!regular_file_size(path)) {
            return unexpected(error{error_code::state_not_found, "no job manifest"});
        }
        auto content = read_text_file(path);
        if (!content) {
            return unexpected(content.error());
        }

        auto url = extract_json_value(content.value(), "first_url");
        if (!url) {
            return unexpected(error{error_code::state_corrupted, "job manifest has no url"});
        }

        job_manifest manifest;
        manifest.first_url = unescape_json_string(*url);
        manifest.file_count = parse_uint(extract_json_value(content.value(), "file_count"));
        manifest.discovered_end =
            parse_uint(extract_json_value(content.value(), "discovered_end"));
        return manifest;
    }

    auto save_manifest(const job_manifest& manifest) -> result<void> {
        std::lock_guard lock(manifest_mutex_);
        return write_file_atomically(directory_ / MANIFEST_FILENAME,
                                     serialize_manifest(manifest));
    }

    auto output_directory() const -> const std::filesystem::path& { return directory_; }

private:
    std::filesystem::path directory_;
    integrity_verifier verifier_;
    std::mutex manifest_mutex_;
};

// ============================================================================
// job_state_store
// ============================================================================

job_state_store::job_state_store(std::filesystem::path output_directory,
                                 verifier_options verification)
    : impl_(std::make_unique<impl>(std::move(output_directory), verification)) {}

job_state_store::~job_state_store() = default;

job_state_store::job_state_store(job_state_store&&) noexcept = default;

auto job_state_store::operator=(job_state_store&&) noexcept -> job_state_store& = default;

auto job_state_store::prepare() -> result<void> {
    return impl_->prepare();
}

auto job_state_store::load(const url_template& tmpl, const load_options& options)
    -> result<std::vector<file_task>> {
    return impl_->load(tmpl, options);
}

auto job_state_store::make_task(const url_template& tmpl, uint64_t index) const -> file_task {
    return impl_->make_task(tmpl, index);
}

auto job_state_store::load_task(const url_template& tmpl, uint64_t index,
                                const load_options& options) -> result<file_task> {
    return impl_->load_task(tmpl, index, options);
}

auto job_state_store::record(const file_task& task) -> result<void> {
    return impl_->record(task);
}

auto job_state_store::read_record(const file_task& task) const -> result<file_task> {
    return impl_->read_record(task);
}

auto job_state_store::forget(const file_task& task) -> result<void> {
    return impl_->forget(task);
}

auto job_state_store::load_manifest() const -> result<job_manifest> {
    return impl_->load_manifest();
}

auto job_state_store::save_manifest(const job_manifest& manifest) -> result<void> {
    return impl_->save_manifest(manifest);
}

auto job_state_store::output_directory() const -> const std::filesystem::path& {
    return impl_->output_directory();
}

auto job_state_store::progress_path(const file_task& task) const -> std::filesystem::path {
    return impl_->progress_path(task);
}

}  // namespace archive_fetch
