/**
 * @file progress_tracker.h
 * @brief Per-upload progress computation and aggregation
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_PROGRESS_TRACKER_H
#define KCENON_CHUNKED_UPLOAD_CORE_PROGRESS_TRACKER_H

#include <kcenon/chunked_upload/core/upload_types.h>

#include <chrono>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Progress bookkeeping for uploads
 */
class progress_tracker {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Fresh pending progress record for a session
     */
    [[nodiscard]] static auto create(const upload_session& session,
                                     clock::time_point now = clock::now())
        -> upload_progress;

    /**
     * @brief Apply the acknowledgment of chunk @p chunk_index
     *
     * uploaded_bytes becomes min((index + 1) * chunk_size, file_size), and
     * speed is the average of the bytes sent since start_time. progress_percent
     * never decreases.
     */
    static void record_chunk(upload_progress& progress,
                             const upload_session& session,
                             uint64_t chunk_index,
                             clock::time_point now = clock::now());

    /**
     * @brief Re-derive byte and chunk counters from a session
     *
     * Used when a session is restored or reconciled with the server.
     */
    static void sync_with_session(upload_progress& progress, const upload_session& session);

    /**
     * @brief Restart speed measurement from the current byte count
     *
     * Bytes acknowledged before @p now no longer count toward speed.
     */
    static void restart_clock(upload_progress& progress, clock::time_point now = clock::now());

    /**
     * @brief Mark an upload as completed at 100%
     */
    static void mark_completed(upload_progress& progress);

    /**
     * @brief Mark an upload as failed
     */
    static void mark_failed(upload_progress& progress, const error& err);

    /**
     * @brief Summarize a set of progress snapshots
     */
    [[nodiscard]] static auto compute_aggregate(const std::vector<upload_progress>& uploads)
        -> aggregate_progress;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_PROGRESS_TRACKER_H
