/**
 * @file upload_types.h
 * @brief Session, progress and option types for chunked uploads
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_UPLOAD_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_UPLOAD_TYPES_H

#include <kcenon/chunked_upload/core/chunk_config.h>
#include <kcenon/chunked_upload/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Upload lifecycle status
 */
enum class upload_status {
    pending,     ///< Created, session not yet initialized
    uploading,   ///< Chunk loop running
    paused,      ///< Chunk loop stopped, state kept for resume
    processing,  ///< All chunks acknowledged, finalize in flight
    completed,   ///< Finalize succeeded
    error        ///< Terminal failure
};

[[nodiscard]] constexpr auto to_string(upload_status status) -> const char* {
    switch (status) {
        case upload_status::pending: return "pending";
        case upload_status::uploading: return "uploading";
        case upload_status::paused: return "paused";
        case upload_status::processing: return "processing";
        case upload_status::completed: return "completed";
        case upload_status::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Parse a status name produced by to_string()
 */
[[nodiscard]] auto upload_status_from_string(std::string_view name)
    -> std::optional<upload_status>;

/**
 * @brief Check whether a status is terminal (completed or error)
 */
[[nodiscard]] constexpr auto is_terminal(upload_status status) -> bool {
    return status == upload_status::completed || status == upload_status::error;
}

/**
 * @brief Client-side record of one file's transfer
 *
 * uploaded_chunks holds acknowledged chunk ids in index order with no gaps,
 * so its length is the next chunk index to upload.
 */
struct upload_session {
    std::string id;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t chunk_size = chunk_config::default_chunk_size;
    uint64_t total_chunks = 0;
    std::vector<std::string> uploaded_chunks;
    std::chrono::system_clock::time_point created_at;
    std::string destination_id;

    [[nodiscard]] auto next_chunk_index() const -> uint64_t {
        return uploaded_chunks.size();
    }

    [[nodiscard]] auto all_chunks_acknowledged() const -> bool {
        return uploaded_chunks.size() >= total_chunks;
    }
};

/**
 * @brief Observable progress of one upload
 */
struct upload_progress {
    std::string file_id;
    std::string file_name;
    uint64_t total_size = 0;
    uint64_t uploaded_bytes = 0;
    uint64_t total_chunks = 0;
    uint64_t uploaded_chunks = 0;
    uint64_t current_chunk = 0;
    double progress_percent = 0.0;
    upload_status status = upload_status::pending;
    std::optional<std::string> error_message;
    std::optional<double> speed_bps;          ///< Cumulative average since start_time
    std::optional<double> eta_seconds;        ///< Unset while speed is zero
    std::chrono::steady_clock::time_point start_time;
    uint64_t start_bytes = 0;                 ///< uploaded_bytes at start_time
    std::optional<std::chrono::steady_clock::time_point> last_chunk_time;
};

/**
 * @brief Summary across several uploads
 */
struct aggregate_progress {
    std::size_t total_files = 0;
    std::size_t completed_files = 0;
    uint64_t total_bytes = 0;
    uint64_t uploaded_bytes = 0;
    double overall_progress_percent = 0.0;
    double average_speed = 0.0;
};

/**
 * @brief Handle returned by the backend's finalize step
 */
struct finalize_result {
    std::string id;     ///< Identifier of the resulting artifact
    std::string body;   ///< Raw backend response, if any
};

/**
 * @brief Description of a scheduled chunk retry
 */
struct retry_event {
    std::string file_id;
    uint64_t chunk_index = 0;
    uint32_t retry_count = 0;
    std::chrono::milliseconds delay{0};
    error last_error;
};

/**
 * @brief Per-upload options and callbacks
 *
 * Callbacks run on the worker executing the upload, with no coordinator
 * lock held, so they may call back into the coordinator.
 */
struct upload_options {
    std::size_t chunk_size = chunk_config::default_chunk_size;
    uint32_t max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};

    std::function<void(const upload_progress&)> on_progress;
    std::function<void(const std::string&, const finalize_result&)> on_complete;
    std::function<void(const std::string&, const error&)> on_error;
    std::function<void(const std::string&)> on_paused;
    std::function<void(const std::string&)> on_resumed;
    std::function<void(const retry_event&)> on_retry;

    [[nodiscard]] auto validate() const -> result<void> {
        return chunk_config(chunk_size).validate();
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_UPLOAD_TYPES_H
