// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file archive_fetch_cli.cpp
 * @brief Command-line front end for bulk archive fetching
 *
 * - Reads settings from .env, the environment and the command line
 * - Prints progress at most once per second
 * - Prompts for a fresh session cookie when the current one expires
 * - Ctrl+C drains in-flight chunks and exits; a rerun resumes
 * - --dedupe removes duplicate archives from a directory
 */

#include <archive_fetch/archive_fetch.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

using namespace archive_fetch;

namespace {

std::atomic<bool> interrupted{false};

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto format_duration(std::chrono::seconds duration) -> std::string {
    auto total = duration.count();
    std::ostringstream oss;
    oss << std::setfill('0');
    if (total >= 3600) {
        oss << total / 3600 << ":" << std::setw(2);
    }
    oss << (total % 3600) / 60 << ":" << std::setw(2) << total % 60;
    return oss.str();
}

/**
 * @brief Shared state between the event callback and the main thread
 */
struct cli_state {
    std::mutex output_mutex;
    std::chrono::steady_clock::time_point last_print{};
    std::atomic<bool> credential_needed{false};
};

void print_progress(const transfer_progress& progress) {
    std::cout << "[" << progress.succeeded << "/" << progress.total << " done";
    if (progress.failed > 0) {
        std::cout << ", " << progress.failed << " failed";
    }
    std::cout << ", " << progress.in_progress << " active] "
              << format_bytes(progress.total_bytes()) << " at "
              << format_bytes(static_cast<uint64_t>(progress.aggregate_rate)) << "/s";
    if (progress.eta) {
        std::cout << ", ETA " << format_duration(*progress.eta);
    }
    std::cout << std::endl;
}

void print_summary(const job_summary& summary) {
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Succeeded:  " << summary.succeeded << "/" << summary.total << std::endl;
    std::cout << "  Failed:     " << summary.failed << std::endl;
    if (summary.unfinished > 0) {
        std::cout << "  Unfinished: " << summary.unfinished << " (rerun to resume)" << std::endl;
    }
    std::cout << "  This run:   " << format_bytes(summary.session_bytes) << " in "
              << format_duration(std::chrono::duration_cast<std::chrono::seconds>(summary.elapsed))
              << std::endl;
    if (summary.historical_bytes > 0) {
        std::cout << "  Resumed:    " << format_bytes(summary.historical_bytes) << std::endl;
    }
    if (summary.fatal_error) {
        std::cout << "  Stopped by: " << summary.fatal_error->message << std::endl;
    }
    std::cout << "========================================" << std::endl;

    for (const auto& path : summary.completed_files) {
        std::cout << path.string() << std::endl;
    }
}

auto run_dedupe(const std::filesystem::path& directory, bool dry_run) -> int {
    duplicate_scanner scanner;
    auto groups = scanner.scan(directory);
    if (!groups.has_value()) {
        std::cerr << "Error: " << groups.error().message << std::endl;
        return 1;
    }

    for (const auto& group : groups.value()) {
        std::cout << "Keep " << group.keep.filename().string() << " ("
                  << format_bytes(group.size) << ")" << std::endl;
        for (const auto& duplicate : group.duplicates) {
            std::cout << "  duplicate: " << duplicate.filename().string() << std::endl;
        }
    }

    auto removed = scanner.remove(groups.value(), dry_run);
    if (!removed.has_value()) {
        std::cerr << "Error: " << removed.error().message << std::endl;
        return 1;
    }
    std::cout << (dry_run ? "Would remove " : "Removed ") << removed.value().files_removed
              << " files, " << format_bytes(removed.value().bytes_freed) << std::endl;
    return 0;
}

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        interrupted = true;
    }
}

void print_usage(const char* program) {
    std::cout << "archive_fetch - resumable bulk archive downloader" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "       " << program << " --dedupe <dir> [--dry-run]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --cookie <value>        Session cookie (or ARCHIVE_FETCH_COOKIE)" << std::endl;
    std::cout << "  --url <url>             URL of the first archive (or ARCHIVE_FETCH_URL)" << std::endl;
    std::cout << "  -o, --output <dir>      Output directory (default: ./downloads)" << std::endl;
    std::cout << "  -n, --count <n>         Number of archives (default: discover)" << std::endl;
    std::cout << "  -p, --parallel <n>      Parallel downloads (default: 6)" << std::endl;
    std::cout << "  --speed-limit <MiB/s>   Aggregate bandwidth cap (default: unlimited)" << std::endl;
    std::cout << "  --no-resume             Discard partial files and start over" << std::endl;
    std::cout << "  --no-verify             Skip ZIP verification" << std::endl;
    std::cout << "  --retries <n>           Retries per archive (default: 5)" << std::endl;
    std::cout << "  --json-log              Write log entries as JSON" << std::endl;
    std::cout << "  --dedupe <dir>          Remove duplicate archives in <dir> and exit" << std::endl;
    std::cout << "  --dry-run               With --dedupe, only report duplicates" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    if (auto loaded = config_loader::load_env_file(".env"); !loaded.has_value()) {
        std::cerr << "Warning: " << loaded.error().message << std::endl;
    }

    auto env_config = config_loader::from_environment();
    if (!env_config.has_value()) {
        std::cerr << "Error: " << env_config.error().message << std::endl;
        return 1;
    }
    auto config = env_config.value();

    std::optional<std::filesystem::path> dedupe_dir;
    bool dry_run = false;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto next = [&](const char* name) -> std::optional<std::string> {
                if (++i >= argc) {
                    std::cerr << "Error: " << name << " requires an argument" << std::endl;
                    return std::nullopt;
                }
                return std::string(argv[i]);
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--cookie") {
                auto value = next("--cookie");
                if (!value) return 1;
                config.credential = *value;
            } else if (arg == "--url") {
                auto value = next("--url");
                if (!value) return 1;
                config.first_url = *value;
            } else if (arg == "-o" || arg == "--output") {
                auto value = next("--output");
                if (!value) return 1;
                config.output_directory = *value;
            } else if (arg == "-n" || arg == "--count") {
                auto value = next("--count");
                if (!value) return 1;
                config.file_count = std::stoull(*value);
            } else if (arg == "-p" || arg == "--parallel") {
                auto value = next("--parallel");
                if (!value) return 1;
                config.concurrency = static_cast<std::size_t>(std::stoul(*value));
            } else if (arg == "--speed-limit") {
                auto value = next("--speed-limit");
                if (!value) return 1;
                config.rate_limit = static_cast<uint64_t>(std::stod(*value) * 1024.0 * 1024.0);
            } else if (arg == "--no-resume") {
                config.resume_enabled = false;
            } else if (arg == "--no-verify") {
                config.verify_enabled = false;
            } else if (arg == "--retries") {
                auto value = next("--retries");
                if (!value) return 1;
                config.retry.max_retries = static_cast<std::size_t>(std::stoul(*value));
            } else if (arg == "--json-log") {
                get_logger().set_output_format(log_output_format::json);
            } else if (arg == "--dedupe") {
                auto value = next("--dedupe");
                if (!value) return 1;
                dedupe_dir = *value;
            } else if (arg == "--dry-run") {
                dry_run = true;
            } else {
                std::cerr << "Error: unknown option " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (dedupe_dir) {
        get_logger().initialize();
        return run_dedupe(*dedupe_dir, dry_run);
    }

    if (config.credential.empty()) {
        std::cerr << "Error: a session cookie is required (--cookie or ARCHIVE_FETCH_COOKIE)"
                  << std::endl;
        return 1;
    }

    auto built = transfer_orchestrator::builder()
        .with_config(config)
        .with_transport(std::make_shared<network_http_transport>(config.request_timeout))
        .build();

    if (!built.has_value()) {
        std::cerr << "Error: " << built.error().message << std::endl;
        return 1;
    }
    auto& job = built.value();

    std::cout << "Fetching " << config.first_url.substr(0, config.first_url.find('?'))
              << std::endl;
    std::cout << "  Output:   " << config.output_directory.string() << std::endl;
    std::cout << "  Archives: "
              << (config.file_count > 0 ? std::to_string(config.file_count) : "discover")
              << std::endl;
    std::cout << "  Workers:  " << config.concurrency << std::endl;
    if (config.rate_limit > 0) {
        std::cout << "  Limit:    " << format_bytes(config.rate_limit) << "/s" << std::endl;
    }
    std::cout << std::endl;

    cli_state state;

    job.on_event([&state](const fetch_event& event) {
        std::lock_guard lock(state.output_mutex);
        switch (event.type) {
            case fetch_event_type::progress: {
                auto now = std::chrono::steady_clock::now();
                if (now - state.last_print >= std::chrono::seconds(1)) {
                    state.last_print = now;
                    print_progress(event.progress);
                }
                break;
            }
            case fetch_event_type::task_status_changed:
                if (event.task && (event.task->status == task_status::done ||
                                   event.task->status == task_status::failed)) {
                    std::cout << "  " << event.task->filename() << ": "
                              << to_string(event.task->status);
                    if (!event.message.empty()) {
                        std::cout << " (" << event.message << ")";
                    }
                    std::cout << std::endl;
                }
                break;
            case fetch_event_type::auth_expired:
                state.credential_needed = true;
                break;
            case fetch_event_type::expiry_warning:
                std::cout << "Warning: " << event.message << std::endl;
                break;
            case fetch_event_type::job_failed:
                std::cerr << "Job failed: " << event.message << std::endl;
                break;
            case fetch_event_type::job_completed:
                break;
        }
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = job.start(); !started.has_value()) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }

    bool cancel_sent = false;
    while (job.state() != orchestrator_state::completed) {
        if (interrupted && !cancel_sent) {
            std::cout << std::endl << "Interrupted, finishing in-flight chunks..." << std::endl;
            job.cancel();
            cancel_sent = true;
        }

        if (state.credential_needed.exchange(false) && !cancel_sent) {
            {
                std::lock_guard lock(state.output_mutex);
                std::cout << std::endl
                          << "Session cookie expired after "
                          << format_duration(std::chrono::duration_cast<std::chrono::seconds>(
                                 job.progress().elapsed))
                          << ". Paste a new cookie (empty line to stop): " << std::flush;
            }
            std::string token;
            if (!std::getline(std::cin, token) || token.empty()) {
                job.cancel();
                cancel_sent = true;
            } else if (auto replaced = job.replace_credential(token); !replaced.has_value()) {
                std::cerr << "Error: " << replaced.error().message << std::endl;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto summary = job.wait();
    print_summary(summary);
    get_logger().shutdown();

    if (summary.cancelled) {
        return 130;
    }
    return summary.is_success() ? 0 : 1;
}
