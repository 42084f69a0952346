// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file job_state_store.h
 * @brief Durable per-archive state surviving process restarts
 * @version 0.1.0
 *
 * On-disk layout inside the output directory:
 * - <name>           completed, verified archive
 * - <name>.partial   bytes received so far
 * - <name>.progress  sidecar record (JSON) for the task
 * - .archive_fetch.json  job manifest (first URL, discovered sequence end)
 *
 * Every record is written to a temporary file and renamed into place.
 */

#ifndef ARCHIVE_FETCH_CORE_JOB_STATE_STORE_H
#define ARCHIVE_FETCH_CORE_JOB_STATE_STORE_H

#include <archive_fetch/core/integrity_verifier.h>
#include <archive_fetch/core/transfer_types.h>
#include <archive_fetch/core/types.h>
#include <archive_fetch/core/url_template.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archive_fetch {

inline constexpr std::string_view PARTIAL_EXTENSION = ".partial";
inline constexpr std::string_view PROGRESS_EXTENSION = ".progress";
inline constexpr std::string_view MANIFEST_FILENAME = ".archive_fetch.json";

/**
 * @brief Job-level record kept next to the archives
 */
struct job_manifest {
    std::string first_url;
    std::optional<uint64_t> file_count;
    /// Last existing index found by probing, when the count was not supplied
    std::optional<uint64_t> discovered_end;
};

/**
 * @brief How load() reconciles on-disk state
 */
struct load_options {
    /// Total number of archives, or nullopt to reconstruct from disk
    std::optional<uint64_t> file_count;
    /// Keep partial files; when false they are deleted and restarted
    bool resume_enabled = true;
    /// Re-verify completed archives not vouched for by a sidecar
    bool verify_completed = true;
};

/**
 * @brief Durable mapping from sequence index to task state
 *
 * @code
 * job_state_store store("./downloads");
 * auto tasks = store.load(tmpl, {.file_count = 100});
 * task.status = task_status::done;
 * store.record(task);
 * @endcode
 *
 * Records for different tasks are independent files, so concurrent
 * record() calls for different tasks never interfere.
 */
class job_state_store {
public:
    explicit job_state_store(std::filesystem::path output_directory,
                             verifier_options verification = {});

    ~job_state_store();

    job_state_store(const job_state_store&) = delete;
    auto operator=(const job_state_store&) -> job_state_store& = delete;
    job_state_store(job_state_store&&) noexcept;
    auto operator=(job_state_store&&) noexcept -> job_state_store&;

    /**
     * @brief Create the output directory if needed
     */
    [[nodiscard]] auto prepare() -> result<void>;

    /**
     * @brief Reconstruct the task set from disk
     *
     * - final file present: done (re-verified unless a done sidecar exists)
     * - partial file present: pending, bytes_confirmed = partial length
     * - sidecars in any non-done state reload as pending with a fresh
     *   retry budget
     * - unreadable sidecars are ignored in favor of file sizes
     */
    [[nodiscard]] auto load(const url_template& tmpl, const load_options& options)
        -> result<std::vector<file_task>>;

    /**
     * @brief Build a fresh pending task for one index
     */
    [[nodiscard]] auto make_task(const url_template& tmpl, uint64_t index) const -> file_task;

    /**
     * @brief Reconcile a single index against disk (used for lazily
     *        discovered tasks)
     */
    [[nodiscard]] auto load_task(const url_template& tmpl, uint64_t index,
                                 const load_options& options) -> result<file_task>;

    /**
     * @brief Persist one task's state
     */
    [[nodiscard]] auto record(const file_task& task) -> result<void>;

    /**
     * @brief Read a task's sidecar
     * @return task fields, state_not_found or state_corrupted
     */
    [[nodiscard]] auto read_record(const file_task& task) const -> result<file_task>;

    /**
     * @brief Remove every trace of a task (final, partial and sidecar)
     */
    [[nodiscard]] auto forget(const file_task& task) -> result<void>;

    [[nodiscard]] auto load_manifest() const -> result<job_manifest>;

    [[nodiscard]] auto save_manifest(const job_manifest& manifest) -> result<void>;

    [[nodiscard]] auto output_directory() const -> const std::filesystem::path&;

    [[nodiscard]] auto progress_path(const file_task& task) const -> std::filesystem::path;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_JOB_STATE_STORE_H
