// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for upload loops
 */

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::chunked_upload::adapters {

namespace {

auto default_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

// Runs task and forwards its completion or exception to promise
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_upload_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class upload_loop_job : public kcenon::thread::job {
public:
    explicit upload_loop_job(std::function<void()> func)
        : job("upload_loop"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_upload_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
};

thread_system_upload_adapter::thread_system_upload_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_upload_adapter::~thread_system_upload_adapter() = default;

thread_system_upload_adapter::thread_system_upload_adapter(
    thread_system_upload_adapter&&) noexcept = default;

thread_system_upload_adapter& thread_system_upload_adapter::operator=(
    thread_system_upload_adapter&&) noexcept = default;

std::shared_ptr<thread_system_upload_adapter>
thread_system_upload_adapter::create_default(size_t worker_count,
                                             const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_upload_adapter>(std::move(pool), pool_name,
                                                          worker_count);
}

std::future<void> thread_system_upload_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);
    auto* in_flight = &pimpl_->in_flight;
    auto wrapped_task = [task = std::move(task), promise, in_flight]() {
        in_flight->fetch_sub(1, std::memory_order_relaxed);
        run_into(task, *promise);
    };

    pimpl_->pool->enqueue(std::make_unique<upload_loop_job>(std::move(wrapped_task)));

    return future;
}

size_t thread_system_upload_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_upload_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_upload_adapter::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_upload_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_upload_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_upload_pool implementation
// ============================================================================

struct async_upload_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
};

async_upload_pool::async_upload_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = default_worker_count(worker_count);
}

async_upload_pool::~async_upload_pool() = default;

std::future<void> async_upload_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async,
                      [pimpl, task = std::move(task)]() {
                          std::promise<void> done;
                          auto result = done.get_future();
                          run_into(task, done);
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                          result.get();
                      });
}

size_t async_upload_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_upload_pool::is_running() const { return true; }

size_t async_upload_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

// ============================================================================
// upload_pool_factory implementation
// ============================================================================

std::shared_ptr<upload_thread_pool_interface> upload_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_upload_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_upload_pool>(worker_count);
#endif
}

}  // namespace kcenon::chunked_upload::adapters
