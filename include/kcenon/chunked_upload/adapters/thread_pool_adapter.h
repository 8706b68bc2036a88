// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for upload loops
 *
 * Every running upload occupies one pool task for the duration of its
 * chunk loop. The pool is thread_system's thread_pool when available and a
 * std::async fallback otherwise.
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::chunked_upload::adapters {

/**
 * @brief Interface for the pool executing upload loops
 */
class upload_thread_pool_interface {
public:
    virtual ~upload_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks that have not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs upload loops on a thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_upload_adapter : public upload_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_upload_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "chunked_upload_pool",
        size_t worker_count = 0);

    ~thread_system_upload_adapter() override;

    thread_system_upload_adapter(const thread_system_upload_adapter&) = delete;
    thread_system_upload_adapter& operator=(const thread_system_upload_adapter&) = delete;

    thread_system_upload_adapter(thread_system_upload_adapter&&) noexcept;
    thread_system_upload_adapter& operator=(thread_system_upload_adapter&&) noexcept;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "chunked_upload_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Each task gets its own thread; worker_count() only reports the hint
 * given at construction.
 */
class async_upload_pool : public upload_thread_pool_interface {
public:
    explicit async_upload_pool(size_t worker_count = 0);
    ~async_upload_pool() override;

    async_upload_pool(const async_upload_pool&) = delete;
    async_upload_pool& operator=(const async_upload_pool&) = delete;

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
 * 1. thread_system_upload_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_upload_pool (fallback)
 */
class upload_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "chunked_upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::chunked_upload::adapters
