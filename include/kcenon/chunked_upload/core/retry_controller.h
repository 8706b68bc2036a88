/**
 * @file retry_controller.h
 * @brief Bounded retries with exponential backoff for chunk uploads
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_RETRY_CONTROLLER_H
#define KCENON_CHUNKED_UPLOAD_CORE_RETRY_CONTROLLER_H

#include <kcenon/chunked_upload/core/cancellation.h>
#include <kcenon/chunked_upload/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>

namespace kcenon::chunked_upload {

/**
 * @brief Retry limits for one chunk
 */
struct retry_policy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};

    /**
     * @brief Wait before retry number @p retry_count (1-based)
     * @return retry_delay * 2^(retry_count - 1)
     */
    [[nodiscard]] auto backoff_delay(uint32_t retry_count) const -> std::chrono::milliseconds;
};

/**
 * @brief How a chunk attempt sequence ended without a terminal failure
 */
enum class retry_status {
    completed,    ///< An attempt succeeded
    interrupted   ///< Pause or cancel was observed
};

struct retry_outcome {
    retry_status status = retry_status::completed;
    uint32_t attempts = 0;
};

/**
 * @brief Runs one chunk upload with bounded, delayed, cancelable retries
 *
 * Attempt 0 runs immediately. After the k-th failure the controller waits
 * backoff_delay(k) on the upload's cancellation token and tries again,
 * until max_retries retries have failed. Each attempt receives a token of
 * its own, linked to the upload's control source.
 */
class retry_controller {
public:
    using attempt_fn = std::function<result<void>(const cancellation_token&)>;
    using retry_hook = std::function<void(uint32_t retry_count,
                                          std::chrono::milliseconds delay,
                                          const error& last_error)>;

    explicit retry_controller(retry_policy policy);

    /**
     * @brief Set a hook invoked before each backoff wait
     */
    void set_retry_hook(retry_hook hook);

    /**
     * @brief Upload chunk @p chunk_index
     * @param chunk_index Index used in logs and the terminal error
     * @param control Pause/cancel source of the upload
     * @param attempt One upload attempt
     * @return Outcome, or chunk_upload_failed once retries are exhausted
     */
    [[nodiscard]] auto run(uint64_t chunk_index,
                           const cancellation_source& control,
                           const attempt_fn& attempt) -> result<retry_outcome>;

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    retry_policy policy_;
    retry_hook hook_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_RETRY_CONTROLLER_H
