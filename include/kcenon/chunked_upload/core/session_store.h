/**
 * @file session_store.h
 * @brief Durable storage of upload sessions for resume across restarts
 *
 * Each session is persisted as a JSON file in the state directory so an
 * interrupted upload can be restored and resumed by a later process.
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_SESSION_STORE_H
#define KCENON_CHUNKED_UPLOAD_CORE_SESSION_STORE_H

#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/core/upload_types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Configuration for session_store
 */
struct session_store_config {
    std::filesystem::path state_directory;  ///< Directory for state files

    session_store_config();

    explicit session_store_config(std::filesystem::path dir);
};

/**
 * @brief File-backed store of upload sessions
 *
 * State files are named after the upload id with unsafe characters
 * replaced, and are cached in memory after the first access.
 *
 * @code
 * session_store store({"/tmp/upload_states"});
 * auto saved = store.save(session);
 * auto loaded = store.load(session.id);
 * @endcode
 */
class session_store {
public:
    explicit session_store(const session_store_config& config);

    ~session_store();

    session_store(const session_store&) = delete;
    auto operator=(const session_store&) -> session_store& = delete;
    session_store(session_store&&) noexcept;
    auto operator=(session_store&&) noexcept -> session_store&;

    /**
     * @brief Persist a session, replacing any previous state
     * @return Success or state_store_error
     */
    [[nodiscard]] auto save(const upload_session& session) -> result<void>;

    /**
     * @brief Load a session
     * @return The session, upload_not_found, or state_store_error
     */
    [[nodiscard]] auto load(const std::string& id) -> result<upload_session>;

    /**
     * @brief Delete a session's state (no-op if absent)
     */
    [[nodiscard]] auto remove(const std::string& id) -> result<void>;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    /**
     * @brief Load every readable session in the state directory
     *
     * Unreadable files are logged and skipped.
     */
    [[nodiscard]] auto list() -> std::vector<upload_session>;

    [[nodiscard]] auto config() const -> const session_store_config&;

    /**
     * @brief Path of the state file for an upload id
     */
    [[nodiscard]] auto state_file_path(const std::string& id) const -> std::filesystem::path;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_SESSION_STORE_H
