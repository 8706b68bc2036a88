/**
 * @file upload_registry.h
 * @brief Map of tracked uploads shared by coordinators and callers
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_REGISTRY_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_REGISTRY_H

#include <kcenon/chunked_upload/core/byte_source.h>
#include <kcenon/chunked_upload/core/cancellation.h>
#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/core/upload_types.h>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief State of one tracked upload
 *
 * All fields are guarded by mutex. cv is notified whenever the upload loop
 * stops running or the entry is cancelled.
 */
struct upload_entry {
    upload_session session;
    upload_progress progress;
    upload_options options;

    std::shared_ptr<byte_source> source;  ///< Held only while a loop may use it
    cancellation_source control;          ///< Replaced on every resume

    bool paused = false;
    bool cancelled = false;
    bool running = false;
    bool session_initialized = false;
    bool needs_reconcile = false;
    uint32_t chunks_since_checkpoint = 0;

    std::optional<finalize_result> result;
    std::optional<error> last_error;

    mutable std::mutex mutex;
    std::condition_variable cv;

    [[nodiscard]] auto snapshot() const -> upload_progress {
        std::lock_guard<std::mutex> lock(mutex);
        return progress;
    }
};

/**
 * @brief Thread-safe registry of uploads keyed by upload id
 *
 * A registry can be shared by several coordinators so that uploads started
 * by one are visible to callers holding another.
 */
class upload_registry {
public:
    upload_registry() = default;

    upload_registry(const upload_registry&) = delete;
    auto operator=(const upload_registry&) -> upload_registry& = delete;

    /**
     * @brief Track a new upload
     * @return invalid_state if the id is already tracked
     */
    [[nodiscard]] auto insert(std::shared_ptr<upload_entry> entry) -> result<void>;

    /**
     * @brief Look up an upload (nullptr if unknown)
     */
    [[nodiscard]] auto find(const std::string& id) const -> std::shared_ptr<upload_entry>;

    /**
     * @brief Stop tracking an upload
     * @return The removed entry, or nullptr if unknown
     */
    auto erase(const std::string& id) -> std::shared_ptr<upload_entry>;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto ids() const -> std::vector<std::string>;

    [[nodiscard]] auto entries() const -> std::vector<std::shared_ptr<upload_entry>>;

    /**
     * @brief Progress snapshot of one upload
     */
    [[nodiscard]] auto snapshot(const std::string& id) const -> std::optional<upload_progress>;

    /**
     * @brief Progress snapshots of the known ids among @p ids
     *
     * Unknown ids are skipped. Each snapshot is taken independently.
     */
    [[nodiscard]] auto snapshots(const std::vector<std::string>& ids) const
        -> std::vector<upload_progress>;

    /**
     * @brief Progress snapshots of every tracked upload
     */
    [[nodiscard]] auto all_snapshots() const -> std::vector<upload_progress>;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<upload_entry>> entries_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_REGISTRY_H
