/**
 * @file upload_coordinator.h
 * @brief Resumable chunked upload coordinator
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_COORDINATOR_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_COORDINATOR_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <kcenon/chunked_upload/adapters/thread_pool_adapter.h>
#include <kcenon/chunked_upload/backend/upload_backend.h>
#include <kcenon/chunked_upload/client/upload_registry.h>
#include <kcenon/chunked_upload/core/byte_source.h>
#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/core/upload_types.h>

namespace kcenon::chunked_upload {

/**
 * @brief Coordinator configuration
 */
struct coordinator_config {
    std::shared_ptr<upload_backend> backend;
    std::shared_ptr<upload_registry> registry;
    std::shared_ptr<adapters::upload_thread_pool_interface> thread_pool;
    std::size_t worker_count = 4;
    std::optional<std::filesystem::path> state_directory;  ///< Enables persistence
    uint32_t checkpoint_interval = 1;  ///< Persist every N acknowledged chunks
};

/**
 * @brief Drives uploads through the session protocol
 *
 * Each upload runs its chunk loop on a pool worker: the backend session is
 * initialized, chunks are sent strictly in index order through the retry
 * controller, and the session is finalized once every chunk is
 * acknowledged. Uploads can be paused, resumed and cancelled from any
 * thread, including from inside their own callbacks.
 *
 * @code
 * auto coordinator = upload_coordinator::builder()
 *     .with_backend(backend)
 *     .with_state_directory("/var/lib/app/uploads")
 *     .build();
 *
 * auto source = file_byte_source::open("video.mp4");
 * auto id = coordinator.value().submit(source.value(), "collection-1", {});
 * auto progress = coordinator.value().wait_for(id.value());
 * @endcode
 *
 * Destroying the coordinator pauses its running uploads and joins their
 * loops.
 */
class upload_coordinator {
public:
    /**
     * @brief Builder for upload_coordinator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the server collaborator (required)
         */
        auto with_backend(std::shared_ptr<upload_backend> backend) -> builder&;

        /**
         * @brief Share an existing registry (default: a private one)
         */
        auto with_registry(std::shared_ptr<upload_registry> registry) -> builder&;

        /**
         * @brief Run loops on an existing pool (default: upload_pool_factory)
         */
        auto with_thread_pool(
            std::shared_ptr<adapters::upload_thread_pool_interface> pool) -> builder&;

        /**
         * @brief Worker count of the default pool (default: 4)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Persist sessions under @p dir so they survive restarts
         */
        auto with_state_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Persist every @p chunks acknowledged chunks (default: 1)
         */
        auto with_checkpoint_interval(uint32_t chunks) -> builder&;

        /**
         * @brief Build the coordinator instance
         * @return Result containing the coordinator or an error
         */
        [[nodiscard]] auto build() -> result<upload_coordinator>;

    private:
        coordinator_config config_;
    };

    // Non-copyable, movable
    upload_coordinator(const upload_coordinator&) = delete;
    auto operator=(const upload_coordinator&) -> upload_coordinator& = delete;
    upload_coordinator(upload_coordinator&&) noexcept;
    auto operator=(upload_coordinator&&) noexcept -> upload_coordinator&;
    ~upload_coordinator();

    // ========================================================================
    // Upload lifecycle
    // ========================================================================

    /**
     * @brief Begin an upload and return immediately
     * @param source Payload
     * @param destination_id Logical destination passed to finalize
     * @param options Chunk size, retry limits and callbacks
     * @return Upload id
     */
    [[nodiscard]] auto submit(std::shared_ptr<byte_source> source,
                              const std::string& destination_id,
                              upload_options options = {}) -> result<std::string>;

    /**
     * @brief Run an upload to completion on the pool and wait for it
     * @return Identifier from the finalize result, or the failure
     */
    [[nodiscard]] auto start(std::shared_ptr<byte_source> source,
                             const std::string& destination_id,
                             upload_options options = {}) -> result<std::string>;

    /**
     * @brief Pause an upload
     *
     * The in-flight attempt or backoff wait is interrupted and the loop
     * returns at its next suspension point. Acknowledged chunks are kept.
     * Pausing a paused upload succeeds; pausing during finalize or after
     * completion fails with invalid_state.
     */
    [[nodiscard]] auto pause(const std::string& file_id) -> result<void>;

    /**
     * @brief Resume a paused upload from its next unacknowledged chunk
     * @param file_id Upload id
     * @param source The same payload again
     * @param options Retry limits and callbacks (chunk size is the session's)
     * @return invalid_state if the upload is not paused
     */
    [[nodiscard]] auto resume(const std::string& file_id,
                              std::shared_ptr<byte_source> source,
                              upload_options options = {}) -> result<void>;

    /**
     * @brief Cancel an upload and forget it
     *
     * Interrupts any pending retry wait and removes the upload from the
     * registry and the state directory. Unknown ids are ignored.
     */
    void cancel(const std::string& file_id);

    /**
     * @brief Re-run only the finalize step of an upload whose chunks are
     *        all acknowledged but whose finalize failed
     */
    [[nodiscard]] auto retry_finalize(const std::string& file_id) -> result<void>;

    /**
     * @brief Forget a completed or failed upload
     */
    [[nodiscard]] auto remove(const std::string& file_id) -> result<void>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto get_progress(const std::string& file_id) const
        -> std::optional<upload_progress>;

    [[nodiscard]] auto get_aggregate_progress(const std::vector<std::string>& file_ids) const
        -> aggregate_progress;

    [[nodiscard]] auto get_all_uploads() const -> std::vector<upload_progress>;

    /**
     * @brief Wait until the upload loop is no longer running
     *
     * Must not be called from the upload's own callbacks.
     * @return Final progress snapshot, wait_timeout, or operation_cancelled
     */
    [[nodiscard]] auto wait_for(
        const std::string& file_id,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::max())
        -> result<upload_progress>;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * @brief Load a persisted session as a paused upload
     */
    [[nodiscard]] auto restore(const std::string& file_id) -> result<upload_progress>;

    /**
     * @brief Restore every persisted session not already tracked
     * @return Ids of the restored uploads
     */
    [[nodiscard]] auto restore_all() -> result<std::vector<std::string>>;

    [[nodiscard]] auto registry() const -> std::shared_ptr<upload_registry>;

    [[nodiscard]] auto config() const -> const coordinator_config&;

private:
    explicit upload_coordinator(coordinator_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_COORDINATOR_H
