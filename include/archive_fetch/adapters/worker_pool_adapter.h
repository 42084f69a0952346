// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.h
 * @brief Worker pool adapter for transfer workers
 *
 * Provides the pool on which resumable transfers run, backed by
 * thread_system when available, network_system's basic pool as a second
 * choice, and std::async otherwise.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace archive_fetch::adapters {

/**
 * @brief Interface for the pool executing transfer workers
 *
 * The caller bounds how many tasks it submits at once; implementations do
 * not queue on its behalf beyond their own worker count.
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "archive_fetch_workers",
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    thread_system_worker_pool(thread_system_worker_pool&&) noexcept;
    thread_system_worker_pool& operator=(thread_system_worker_pool&&) noexcept;

    /**
     * @brief Create and start a pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "archive_fetch_workers");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Pool backed by network_system's thread_pool_interface
 */
class network_worker_pool : public worker_pool_interface {
public:
    explicit network_worker_pool(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool);

    ~network_worker_pool() override;

    network_worker_pool(const network_worker_pool&) = delete;
    network_worker_pool& operator=(const network_worker_pool&) = delete;

    network_worker_pool(network_worker_pool&&) noexcept;
    network_worker_pool& operator=(network_worker_pool&&) noexcept;

    /**
     * @brief Create a pool on network_system's basic_thread_pool
     */
    [[nodiscard]] static std::shared_ptr<network_worker_pool> create_basic(size_t worker_count = 0);

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback pool using std::async
 *
 * Every submitted task gets its own thread; the caller's concurrency limit
 * keeps the count bounded. worker_count() reports the requested size.
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(size_t worker_count = 0);
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. network_worker_pool (when KCENON_WITH_NETWORK_SYSTEM only)
 * 3. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "archive_fetch_workers");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace archive_fetch::adapters
