/**
 * @file progress_tracker.cpp
 * @brief Implementation of progress bookkeeping
 */

#include <kcenon/chunked_upload/core/progress_tracker.h>

#include <algorithm>

namespace kcenon::chunked_upload {

namespace {

auto percent_of(uint64_t part, uint64_t whole) -> double {
    if (whole == 0) {
        return 0.0;
    }
    return std::min(static_cast<double>(part) / static_cast<double>(whole) * 100.0, 100.0);
}

}  // namespace

auto progress_tracker::create(const upload_session& session, clock::time_point now)
    -> upload_progress {
    upload_progress progress;
    progress.file_id = session.id;
    progress.file_name = session.file_name;
    progress.total_size = session.file_size;
    progress.total_chunks = session.total_chunks;
    progress.status = upload_status::pending;
    progress.start_time = now;
    return progress;
}

void progress_tracker::record_chunk(upload_progress& progress,
                                    const upload_session& session,
                                    uint64_t chunk_index,
                                    clock::time_point now) {
    auto uploaded_bytes = std::min<uint64_t>((chunk_index + 1) * session.chunk_size,
                                             session.file_size);

    progress.uploaded_bytes = uploaded_bytes;
    progress.uploaded_chunks = chunk_index + 1;
    progress.current_chunk = chunk_index;
    progress.progress_percent =
        std::max(progress.progress_percent, percent_of(uploaded_bytes, session.file_size));
    progress.status = upload_status::uploading;
    progress.last_chunk_time = now;

    auto sent = uploaded_bytes - std::min(progress.start_bytes, uploaded_bytes);
    auto elapsed = std::chrono::duration<double>(now - progress.start_time).count();
    double speed = elapsed > 0.0 ? static_cast<double>(sent) / elapsed : 0.0;
    progress.speed_bps = speed;

    if (speed > 0.0) {
        progress.eta_seconds =
            static_cast<double>(session.file_size - uploaded_bytes) / speed;
    } else {
        progress.eta_seconds.reset();
    }
}

void progress_tracker::sync_with_session(upload_progress& progress,
                                         const upload_session& session) {
    auto acknowledged = std::min<uint64_t>(session.uploaded_chunks.size(), session.total_chunks);

    progress.total_size = session.file_size;
    progress.total_chunks = session.total_chunks;
    progress.uploaded_chunks = acknowledged;
    progress.uploaded_bytes =
        std::min<uint64_t>(acknowledged * session.chunk_size, session.file_size);
    progress.current_chunk = acknowledged > 0 ? acknowledged - 1 : 0;
    progress.progress_percent = percent_of(progress.uploaded_bytes, session.file_size);
    progress.start_bytes = std::min(progress.start_bytes, progress.uploaded_bytes);
}

void progress_tracker::restart_clock(upload_progress& progress, clock::time_point now) {
    progress.start_time = now;
    progress.start_bytes = progress.uploaded_bytes;
    progress.speed_bps.reset();
    progress.eta_seconds.reset();
}

void progress_tracker::mark_completed(upload_progress& progress) {
    progress.status = upload_status::completed;
    progress.progress_percent = 100.0;
    progress.uploaded_bytes = progress.total_size;
    progress.uploaded_chunks = progress.total_chunks;
    progress.eta_seconds = 0.0;
    progress.error_message.reset();
}

void progress_tracker::mark_failed(upload_progress& progress, const error& err) {
    progress.status = upload_status::error;
    progress.error_message = err.message;
}

auto progress_tracker::compute_aggregate(const std::vector<upload_progress>& uploads)
    -> aggregate_progress {
    aggregate_progress aggregate;
    aggregate.total_files = uploads.size();

    double speed_sum = 0.0;
    for (const auto& upload : uploads) {
        if (upload.status == upload_status::completed) {
            ++aggregate.completed_files;
        }
        aggregate.total_bytes += upload.total_size;
        aggregate.uploaded_bytes += upload.uploaded_bytes;
        speed_sum += upload.speed_bps.value_or(0.0);
    }

    if (aggregate.total_bytes > 0) {
        aggregate.overall_progress_percent = static_cast<double>(aggregate.uploaded_bytes) /
                                             static_cast<double>(aggregate.total_bytes) * 100.0;
    }
    if (!uploads.empty()) {
        aggregate.average_speed = speed_sum / static_cast<double>(uploads.size());
    }

    return aggregate;
}

}  // namespace kcenon::chunked_upload
