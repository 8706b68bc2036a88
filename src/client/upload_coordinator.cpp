/**
 * @file upload_coordinator.cpp
 * @brief Implementation of the upload coordinator
 */

#include <kcenon/chunked_upload/client/upload_coordinator.h>

#include <kcenon/chunked_upload/core/chunk_splitter.h>
#include <kcenon/chunked_upload/core/logging.h>
#include <kcenon/chunked_upload/core/progress_tracker.h>
#include <kcenon/chunked_upload/core/retry_controller.h>
#include <kcenon/chunked_upload/core/session_store.h>
#include <kcenon/chunked_upload/core/upload_id.h>

#include <atomic>
#include <future>
#include <mutex>
#include <utility>

namespace kcenon::chunked_upload {

namespace {

auto make_log_context(const upload_entry& entry) -> upload_log_context {
    upload_log_context ctx;
    ctx.upload_id = entry.session.id;
    ctx.filename = entry.session.file_name;
    ctx.file_size = entry.session.file_size;
    ctx.uploaded_bytes = entry.progress.uploaded_bytes;
    ctx.total_chunks = entry.session.total_chunks;
    ctx.progress_percent = entry.progress.progress_percent;
    return ctx;
}

enum class loop_exit {
    finished,     ///< Completed or failed
    interrupted,  ///< Paused, cancelled, or shutting down
};

}  // namespace

// ============================================================================
// upload_coordinator::impl
// ============================================================================

struct upload_coordinator::impl {
    coordinator_config config;
    std::unique_ptr<session_store> store;
    std::atomic<bool> shutting_down{false};

    std::mutex tasks_mutex;
    std::vector<std::pair<std::shared_ptr<upload_entry>, std::future<void>>> tasks;

    explicit impl(coordinator_config cfg) : config(std::move(cfg)) {
        if (config.state_directory) {
            store = std::make_unique<session_store>(
                session_store_config(*config.state_directory));
        }
    }

    ~impl() {
        shutting_down = true;

        std::vector<std::pair<std::shared_ptr<upload_entry>, std::future<void>>> pending;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex);
            pending = std::move(tasks);
        }

        for (auto& [entry, task] : pending) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            auto status = entry->progress.status;
            if (!entry->cancelled && !entry->paused && status != upload_status::processing &&
                !is_terminal(status)) {
                entry->paused = true;
                entry->progress.status = upload_status::paused;
                entry->control.cancel();
                persist_locked(*entry);
            }
        }

        for (auto& [entry, task] : pending) {
            if (task.valid()) {
                task.wait();
            }
        }

        CU_LOG_DEBUG(log_category::coordinator, "Upload coordinator stopped");
    }

    // Caller holds entry.mutex
    void persist_locked(const upload_entry& entry) {
        if (!store || entry.cancelled || !entry.session_initialized) {
            return;
        }
        auto saved = store->save(entry.session);
        if (!saved) {
            auto ctx = make_log_context(entry);
            ctx.error_message = saved.error().message;
            CU_LOG_WARN_CTX(log_category::store, "Failed to persist upload session", ctx);
        }
    }

    void remove_state(const std::string& id) {
        if (!store || !store->contains(id)) {
            return;
        }
        auto removed = store->remove(id);
        if (!removed) {
            CU_LOG_WARN(log_category::store,
                        "Failed to remove upload state " + id + ": " +
                            removed.error().message);
        }
    }

    void schedule(const std::shared_ptr<upload_entry>& entry) {
        auto task = config.thread_pool->submit([this, entry]() { run_upload(entry); });

        std::lock_guard<std::mutex> lock(tasks_mutex);
        std::erase_if(tasks, [](auto& item) {
            return !item.second.valid() ||
                   item.second.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
        tasks.emplace_back(entry, std::move(task));
    }

    // ========================================================================
    // Upload loop
    // ========================================================================

    /**
     * @brief Clears entry->running when the loop leaves without handing off
     */
    struct running_guard {
        std::shared_ptr<upload_entry> entry;
        bool active = true;

        ~running_guard() {
            if (!active) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                entry->running = false;
            }
            entry->cv.notify_all();
        }
    };

    void run_upload(const std::shared_ptr<upload_entry>& entry) {
        running_guard guard{entry};

        while (run_once(entry) == loop_exit::interrupted) {
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (!entry->cancelled && !entry->paused && !shutting_down) {
                    // Resumed while the previous attempt was being interrupted
                    continue;
                }
                entry->running = false;
                guard.active = false;
                auto ctx = make_log_context(*entry);
                CU_LOG_DEBUG_CTX(log_category::coordinator, "Upload loop suspended", ctx);
            }
            entry->cv.notify_all();
            return;
        }
    }

    auto run_once(const std::shared_ptr<upload_entry>& entry) -> loop_exit {
        upload_session session;
        bool needs_init = false;
        bool needs_reconcile = false;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->cancelled || entry->paused || shutting_down) {
                return loop_exit::interrupted;
            }
            session = entry->session;
            needs_init = !entry->session_initialized;
            needs_reconcile = entry->needs_reconcile;
        }

        if (needs_init) {
            auto initialized = config.backend->initialize_session(session);
            if (!initialized) {
                fail(entry, error{error_code::session_init_failed,
                                  "failed to initialize upload session: " +
                                      initialized.error().message});
                return loop_exit::finished;
            }

            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->cancelled) {
                return loop_exit::interrupted;
            }
            entry->session_initialized = true;
            persist_locked(*entry);
            auto ctx = make_log_context(*entry);
            CU_LOG_INFO_CTX(log_category::coordinator, "Upload session initialized", ctx);
        }

        if (needs_reconcile) {
            reconcile(entry, session.id);
        }

        for (;;) {
            uint64_t index = 0;
            cancellation_source control;
            std::shared_ptr<byte_source> source;
            upload_options options;
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (entry->cancelled || entry->paused || shutting_down) {
                    return loop_exit::interrupted;
                }
                session = entry->session;
                index = session.next_chunk_index();
                if (index >= session.total_chunks) {
                    break;
                }
                control = entry->control;
                source = entry->source;
                options = entry->options;
                entry->progress.status = upload_status::uploading;
                entry->progress.current_chunk = index;
            }

            if (!source) {
                fail(entry, error{error_code::invalid_state,
                                  "no data source attached to upload " + session.id});
                return loop_exit::finished;
            }

            chunk_splitter splitter{chunk_config(session.chunk_size)};
            auto read = splitter.read_chunk(*source, index);
            if (!read) {
                fail(entry, read.error());
                return loop_exit::finished;
            }
            auto data = std::move(read).value();

            retry_controller retries(retry_policy{options.max_retries, options.retry_delay});
            retries.set_retry_hook([&](uint32_t retry_count, std::chrono::milliseconds delay,
                                       const error& last_error) {
                if (options.on_retry) {
                    options.on_retry(
                        retry_event{session.id, index, retry_count, delay, last_error});
                }
            });

            auto outcome = retries.run(index, control, [&](const cancellation_token& token) {
                return config.backend->upload_chunk(session.id, data, token);
            });
            if (!outcome) {
                fail(entry, outcome.error());
                return loop_exit::finished;
            }
            if (outcome.value().status == retry_status::interrupted) {
                return loop_exit::interrupted;
            }

            upload_progress snapshot;
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (entry->cancelled) {
                    return loop_exit::interrupted;
                }
                entry->session.uploaded_chunks.push_back(make_chunk_id(index));
                progress_tracker::record_chunk(entry->progress, entry->session, index);
                if (entry->paused) {
                    entry->progress.status = upload_status::paused;
                }

                if (++entry->chunks_since_checkpoint >= config.checkpoint_interval ||
                    entry->session.all_chunks_acknowledged()) {
                    persist_locked(*entry);
                    entry->chunks_since_checkpoint = 0;
                }

                auto ctx = make_log_context(*entry);
                ctx.chunk_index = index;
                ctx.speed_bps = entry->progress.speed_bps;
                CU_LOG_DEBUG_CTX(log_category::progress, "Chunk acknowledged", ctx);
                snapshot = entry->progress;
            }

            if (options.on_progress) {
                options.on_progress(snapshot);
            }
        }

        return finalize(entry);
    }

    auto finalize(const std::shared_ptr<upload_entry>& entry) -> loop_exit {
        std::string id;
        std::string destination_id;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->cancelled || entry->paused || shutting_down) {
                return loop_exit::interrupted;
            }
            id = entry->session.id;
            destination_id = entry->session.destination_id;
            entry->progress.status = upload_status::processing;
            entry->chunks_since_checkpoint = 0;
            persist_locked(*entry);
            auto ctx = make_log_context(*entry);
            CU_LOG_INFO_CTX(log_category::coordinator, "Finalizing upload", ctx);
        }

        auto finalized = config.backend->finalize_session(id, destination_id);
        if (!finalized) {
            fail(entry, error{error_code::finalize_failed,
                              "failed to finalize upload: " + finalized.error().message});
            return loop_exit::finished;
        }

        upload_progress snapshot;
        upload_options options;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->cancelled) {
                return loop_exit::finished;
            }
            progress_tracker::mark_completed(entry->progress);
            entry->result = finalized.value();
            entry->last_error.reset();
            entry->source.reset();
            snapshot = entry->progress;
            options = entry->options;

            auto ctx = make_log_context(*entry);
            ctx.speed_bps = entry->progress.speed_bps;
            CU_LOG_INFO_CTX(log_category::coordinator,
                            "Upload completed as " + finalized.value().id, ctx);
        }

        remove_state(id);

        if (options.on_progress) {
            options.on_progress(snapshot);
        }
        if (options.on_complete) {
            options.on_complete(id, finalized.value());
        }
        return loop_exit::finished;
    }

    void reconcile(const std::shared_ptr<upload_entry>& entry, const std::string& id) {
        auto received = config.backend->query_received_chunks(id);

        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->needs_reconcile = false;
        if (!received) {
            CU_LOG_DEBUG(log_category::coordinator,
                         "Received chunk count unavailable for " + id +
                             ", keeping local state: " + received.error().message);
            return;
        }

        auto& chunks = entry->session.uploaded_chunks;
        if (received.value() < chunks.size()) {
            auto ctx = make_log_context(*entry);
            ctx.chunk_index = received.value();
            CU_LOG_WARN_CTX(log_category::coordinator,
                            "Server holds fewer chunks than recorded, rewinding", ctx);
            chunks.resize(static_cast<std::size_t>(received.value()));
            progress_tracker::sync_with_session(entry->progress, entry->session);
            persist_locked(*entry);
        }
    }

    void fail(const std::shared_ptr<upload_entry>& entry, const error& err) {
        std::string id;
        upload_options options;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->cancelled) {
                return;
            }
            // A pause that raced with the failing step no longer applies
            entry->paused = false;
            progress_tracker::mark_failed(entry->progress, err);
            entry->last_error = err;
            persist_locked(*entry);
            id = entry->session.id;
            options = entry->options;

            auto ctx = make_log_context(*entry);
            ctx.error_message = err.message;
            CU_LOG_ERROR_CTX(log_category::coordinator, "Upload failed", ctx);
        }

        if (options.on_error) {
            options.on_error(id, err);
        }
    }
};

// ============================================================================
// Builder implementation
// ============================================================================

upload_coordinator::builder::builder() = default;

auto upload_coordinator::builder::with_backend(std::shared_ptr<upload_backend> backend)
    -> builder& {
    config_.backend = std::move(backend);
    return *this;
}

auto upload_coordinator::builder::with_registry(std::shared_ptr<upload_registry> registry)
    -> builder& {
    config_.registry = std::move(registry);
    return *this;
}

auto upload_coordinator::builder::with_thread_pool(
    std::shared_ptr<adapters::upload_thread_pool_interface> pool) -> builder& {
    config_.thread_pool = std::move(pool);
    return *this;
}

auto upload_coordinator::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto upload_coordinator::builder::with_state_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.state_directory = dir;
    return *this;
}

auto upload_coordinator::builder::with_checkpoint_interval(uint32_t chunks) -> builder& {
    config_.checkpoint_interval = chunks;
    return *this;
}

auto upload_coordinator::builder::build() -> result<upload_coordinator> {
    if (!config_.backend) {
        return unexpected(
            error{error_code::invalid_configuration, "upload backend is required"});
    }
    if (config_.checkpoint_interval == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "checkpoint interval must be greater than 0"});
    }
    if (!config_.thread_pool && config_.worker_count == 0) {
        return unexpected(
            error{error_code::invalid_configuration, "worker count must be greater than 0"});
    }

    get_logger().initialize();

    if (!config_.registry) {
        config_.registry = std::make_shared<upload_registry>();
    }
    if (!config_.thread_pool) {
        config_.thread_pool = adapters::upload_pool_factory::create(config_.worker_count);
    }

    CU_LOG_INFO(log_category::coordinator,
                "Upload coordinator created (workers: " +
                    std::to_string(config_.thread_pool->worker_count()) + ", persistence: " +
                    (config_.state_directory ? config_.state_directory->string() : "off") +
                    ")");

    return upload_coordinator(config_);
}

// ============================================================================
// upload_coordinator implementation
// ============================================================================

upload_coordinator::upload_coordinator(coordinator_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

upload_coordinator::upload_coordinator(upload_coordinator&&) noexcept = default;
auto upload_coordinator::operator=(upload_coordinator&&) noexcept
    -> upload_coordinator& = default;
upload_coordinator::~upload_coordinator() = default;

auto upload_coordinator::submit(std::shared_ptr<byte_source> source,
                                const std::string& destination_id,
                                upload_options options) -> result<std::string> {
    if (!source) {
        return unexpected(error{error_code::invalid_configuration, "data source is required"});
    }
    if (auto valid = options.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (impl_->shutting_down) {
        return unexpected(error{error_code::invalid_state, "coordinator is shutting down"});
    }

    auto entry = std::make_shared<upload_entry>();
    auto& session = entry->session;
    session.file_name = source->name();
    session.file_size = source->size();
    session.id = generate_upload_id(session.file_name, session.file_size);
    session.chunk_size = options.chunk_size;
    session.total_chunks = chunk_config(options.chunk_size).calculate_chunk_count(session.file_size);
    session.created_at = std::chrono::system_clock::now();
    session.destination_id = destination_id;

    entry->progress = progress_tracker::create(session);
    entry->options = std::move(options);
    entry->source = std::move(source);
    entry->running = true;

    auto id = session.id;
    auto ctx = make_log_context(*entry);

    if (auto inserted = impl_->config.registry->insert(entry); !inserted) {
        return unexpected(inserted.error());
    }

    CU_LOG_INFO_CTX(log_category::coordinator, "Upload submitted", ctx);
    impl_->schedule(entry);
    return id;
}

auto upload_coordinator::start(std::shared_ptr<byte_source> source,
                               const std::string& destination_id,
                               upload_options options) -> result<std::string> {
    auto id = submit(std::move(source), destination_id, std::move(options));
    if (!id) {
        return unexpected(id.error());
    }

    auto waited = wait_for(id.value());
    if (!waited) {
        return unexpected(waited.error());
    }

    auto entry = impl_->config.registry->find(id.value());
    if (!entry) {
        return unexpected(error{error_code::operation_cancelled, "upload was cancelled"});
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->result) {
        return entry->result->id;
    }
    if (entry->progress.status == upload_status::error && entry->last_error) {
        return unexpected(*entry->last_error);
    }
    return unexpected(
        error{error_code::operation_cancelled, "upload paused before completion"});
}

auto upload_coordinator::pause(const std::string& file_id) -> result<void> {
    auto entry = impl_->config.registry->find(file_id);
    if (!entry) {
        return unexpected(error{error_code::upload_not_found, "upload not found: " + file_id});
    }

    upload_options options;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->cancelled) {
            return unexpected(
                error{error_code::upload_not_found, "upload not found: " + file_id});
        }
        auto status = entry->progress.status;
        if (status == upload_status::processing || is_terminal(status)) {
            return unexpected(error{error_code::invalid_state,
                                    "cannot pause upload in state " +
                                        std::string(to_string(status))});
        }
        if (entry->paused) {
            return {};
        }

        entry->paused = true;
        entry->progress.status = upload_status::paused;
        entry->control.cancel();
        impl_->persist_locked(*entry);
        options = entry->options;

        auto ctx = make_log_context(*entry);
        CU_LOG_INFO_CTX(log_category::coordinator, "Upload paused", ctx);
    }

    if (options.on_paused) {
        options.on_paused(file_id);
    }
    return {};
}

auto upload_coordinator::resume(const std::string& file_id,
                                std::shared_ptr<byte_source> source,
                                upload_options options) -> result<void> {
    if (!source) {
        return unexpected(error{error_code::invalid_configuration, "data source is required"});
    }
    if (impl_->shutting_down) {
        return unexpected(error{error_code::invalid_state, "coordinator is shutting down"});
    }

    auto entry = impl_->config.registry->find(file_id);
    if (!entry) {
        return unexpected(error{error_code::upload_not_found, "upload not found: " + file_id});
    }

    bool needs_schedule = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->cancelled) {
            return unexpected(
                error{error_code::upload_not_found, "upload not found: " + file_id});
        }
        if (!entry->paused || is_terminal(entry->progress.status)) {
            return unexpected(error{error_code::invalid_state,
                                    "upload is not paused: " + file_id + " (" +
                                        std::string(to_string(entry->progress.status)) +
                                        ")"});
        }
        if (source->size() != entry->session.file_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "source size " + std::to_string(source->size()) +
                                        " does not match session size " +
                                        std::to_string(entry->session.file_size)});
        }

        options.chunk_size = entry->session.chunk_size;
        entry->options = std::move(options);
        entry->source = std::move(source);
        entry->control = cancellation_source{};
        entry->paused = false;
        entry->progress.status = upload_status::uploading;
        entry->progress.error_message.reset();
        if (entry->needs_reconcile) {
            // First run since restore; time spent before the restart is unknown
            progress_tracker::restart_clock(entry->progress);
        }

        needs_schedule = !entry->running;
        entry->running = true;
        options = entry->options;

        auto ctx = make_log_context(*entry);
        ctx.chunk_index = entry->session.next_chunk_index();
        CU_LOG_INFO_CTX(log_category::coordinator, "Upload resumed", ctx);
    }

    if (options.on_resumed) {
        options.on_resumed(file_id);
    }
    if (needs_schedule) {
        impl_->schedule(entry);
    }
    return {};
}

void upload_coordinator::cancel(const std::string& file_id) {
    auto entry = impl_->config.registry->erase(file_id);
    if (!entry) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->cancelled) {
            return;
        }
        entry->cancelled = true;
        entry->control.cancel();
        auto ctx = make_log_context(*entry);
        CU_LOG_INFO_CTX(log_category::coordinator, "Upload cancelled", ctx);
    }
    entry->cv.notify_all();

    impl_->remove_state(file_id);
}

auto upload_coordinator::retry_finalize(const std::string& file_id) -> result<void> {
    auto entry = impl_->config.registry->find(file_id);
    if (!entry) {
        return unexpected(error{error_code::upload_not_found, "upload not found: " + file_id});
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->running) {
            return unexpected(
                error{error_code::already_running, "upload is still running: " + file_id});
        }
        if (entry->progress.status != upload_status::error ||
            !entry->session.all_chunks_acknowledged()) {
            return unexpected(error{error_code::invalid_state,
                                    "upload has no failed finalize to retry: " + file_id});
        }

        entry->last_error.reset();
        entry->progress.error_message.reset();
        entry->progress.status = upload_status::processing;
        entry->running = true;
        auto ctx = make_log_context(*entry);
        CU_LOG_INFO_CTX(log_category::coordinator, "Retrying finalize", ctx);
    }

    impl_->schedule(entry);
    return {};
}

auto upload_coordinator::remove(const std::string& file_id) -> result<void> {
    auto entry = impl_->config.registry->find(file_id);
    if (!entry) {
        return unexpected(error{error_code::upload_not_found, "upload not found: " + file_id});
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->running || !is_terminal(entry->progress.status)) {
            return unexpected(error{error_code::invalid_state,
                                    "only finished uploads can be removed: " + file_id});
        }
    }

    impl_->config.registry->erase(file_id);
    impl_->remove_state(file_id);
    CU_LOG_DEBUG(log_category::coordinator, "Upload removed: " + file_id);
    return {};
}

auto upload_coordinator::get_progress(const std::string& file_id) const
    -> std::optional<upload_progress> {
    return impl_->config.registry->snapshot(file_id);
}

auto upload_coordinator::get_aggregate_progress(const std::vector<std::string>& file_ids) const
    -> aggregate_progress {
    return progress_tracker::compute_aggregate(impl_->config.registry->snapshots(file_ids));
}

auto upload_coordinator::get_all_uploads() const -> std::vector<upload_progress> {
    return impl_->config.registry->all_snapshots();
}

auto upload_coordinator::wait_for(const std::string& file_id,
                                  std::chrono::milliseconds timeout)
    -> result<upload_progress> {
    auto entry = impl_->config.registry->find(file_id);
    if (!entry) {
        return unexpected(error{error_code::upload_not_found, "upload not found: " + file_id});
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    auto stopped = [&entry]() { return !entry->running || entry->cancelled; };
    if (timeout == std::chrono::milliseconds::max()) {
        entry->cv.wait(lock, stopped);
    } else if (!entry->cv.wait_for(lock, timeout, stopped)) {
        return unexpected(error{error_code::wait_timeout,
                                "timed out waiting for upload " + file_id});
    }

    if (entry->cancelled) {
        return unexpected(
            error{error_code::operation_cancelled, "upload was cancelled: " + file_id});
    }
    return entry->progress;
}

auto upload_coordinator::restore(const std::string& file_id) -> result<upload_progress> {
    if (!impl_->store) {
        return unexpected(
            error{error_code::invalid_configuration, "no state directory configured"});
    }
    if (impl_->config.registry->contains(file_id)) {
        return unexpected(
            error{error_code::invalid_state, "upload already tracked: " + file_id});
    }

    auto loaded = impl_->store->load(file_id);
    if (!loaded) {
        return unexpected(loaded.error());
    }

    auto entry = std::make_shared<upload_entry>();
    entry->session = std::move(loaded).value();
    entry->progress = progress_tracker::create(entry->session);
    progress_tracker::sync_with_session(entry->progress, entry->session);
    progress_tracker::restart_clock(entry->progress);
    entry->progress.status = upload_status::paused;
    entry->options.chunk_size = entry->session.chunk_size;
    entry->paused = true;
    entry->session_initialized = true;
    entry->needs_reconcile = true;

    auto progress = entry->progress;
    auto ctx = make_log_context(*entry);

    if (auto inserted = impl_->config.registry->insert(entry); !inserted) {
        return unexpected(inserted.error());
    }

    CU_LOG_INFO_CTX(log_category::coordinator, "Upload restored", ctx);
    return progress;
}

auto upload_coordinator::restore_all() -> result<std::vector<std::string>> {
    if (!impl_->store) {
        return unexpected(
            error{error_code::invalid_configuration, "no state directory configured"});
    }

    std::vector<std::string> restored;
    for (const auto& session : impl_->store->list()) {
        if (impl_->config.registry->contains(session.id)) {
            continue;
        }
        auto progress = restore(session.id);
        if (!progress) {
            CU_LOG_WARN(log_category::coordinator,
                        "Skipping stored upload " + session.id + ": " +
                            progress.error().message);
            continue;
        }
        restored.push_back(session.id);
    }
    return restored;
}

auto upload_coordinator::registry() const -> std::shared_ptr<upload_registry> {
    return impl_->config.registry;
}

auto upload_coordinator::config() const -> const coordinator_config& {
    return impl_->config;
}

}  // namespace kcenon::chunked_upload
