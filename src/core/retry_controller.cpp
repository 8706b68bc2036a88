/**
 * @file retry_controller.cpp
 * @brief Implementation of chunk retry with exponential backoff
 */

#include <kcenon/chunked_upload/core/retry_controller.h>

#include <kcenon/chunked_upload/core/logging.h>

#include <algorithm>

namespace kcenon::chunked_upload {

namespace {

// Keeps 2^(k-1) within 64 bits for absurd retry counts
constexpr uint32_t max_backoff_shift = 30;

}  // namespace

auto retry_policy::backoff_delay(uint32_t retry_count) const -> std::chrono::milliseconds {
    if (retry_count == 0) {
        return std::chrono::milliseconds{0};
    }
    auto shift = std::min(retry_count - 1, max_backoff_shift);
    return retry_delay * (int64_t{1} << shift);
}

retry_controller::retry_controller(retry_policy policy) : policy_(policy) {}

void retry_controller::set_retry_hook(retry_hook hook) {
    hook_ = std::move(hook);
}

auto retry_controller::run(uint64_t chunk_index,
                           const cancellation_source& control,
                           const attempt_fn& attempt) -> result<retry_outcome> {
    retry_outcome outcome;
    uint32_t retry_count = 0;

    while (true) {
        if (control.is_cancelled()) {
            outcome.status = retry_status::interrupted;
            return outcome;
        }

        auto attempt_source = control.create_linked();
        ++outcome.attempts;

        auto attempt_result = attempt(attempt_source.token());
        if (attempt_result) {
            outcome.status = retry_status::completed;
            return outcome;
        }

        // A failure caused by pause or cancel is not a chunk failure
        if (control.is_cancelled()) {
            outcome.status = retry_status::interrupted;
            return outcome;
        }

        const auto& last_error = attempt_result.error();
        ++retry_count;

        if (retry_count > policy_.max_retries) {
            upload_log_context ctx;
            ctx.chunk_index = chunk_index;
            ctx.retry_count = retry_count - 1;
            ctx.error_message = last_error.message;
            CU_LOG_ERROR_CTX(log_category::retry, "Chunk retries exhausted", ctx);

            return unexpected(error{
                error_code::chunk_upload_failed,
                "failed to upload chunk " + std::to_string(chunk_index) + " after " +
                    std::to_string(policy_.max_retries) + " retries: " + last_error.message});
        }

        auto delay = policy_.backoff_delay(retry_count);

        upload_log_context ctx;
        ctx.chunk_index = chunk_index;
        ctx.retry_count = retry_count;
        ctx.delay_ms = static_cast<uint64_t>(delay.count());
        ctx.error_message = last_error.message;
        CU_LOG_WARN_CTX(log_category::retry, "Chunk upload failed, retrying", ctx);

        if (hook_) {
            hook_(retry_count, delay, last_error);
        }

        if (control.token().wait_for(delay)) {
            CU_LOG_DEBUG(log_category::retry,
                         "Backoff wait for chunk " + std::to_string(chunk_index) +
                             " interrupted");
            outcome.status = retry_status::interrupted;
            return outcome;
        }
    }
}

}  // namespace kcenon::chunked_upload
