/**
 * @file upload_backend.h
 * @brief Remote side of the session-based upload protocol
 */

#ifndef KCENON_CHUNKED_UPLOAD_BACKEND_UPLOAD_BACKEND_H
#define KCENON_CHUNKED_UPLOAD_BACKEND_UPLOAD_BACKEND_H

#include <kcenon/chunked_upload/core/cancellation.h>
#include <kcenon/chunked_upload/core/chunk_splitter.h>
#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/core/upload_types.h>

#include <cstdint>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Server collaborator of the upload coordinator
 *
 * Implementations must be safe to call from several worker threads at
 * once, for different sessions. upload_chunk() must be idempotent for the
 * same (session_id, chunk index) since a chunk may be retried after the
 * server already accepted it.
 */
class upload_backend {
public:
    virtual ~upload_backend() = default;

    /**
     * @brief Register upload metadata before any chunk is sent
     */
    [[nodiscard]] virtual auto initialize_session(const upload_session& session)
        -> result<void> = 0;

    /**
     * @brief Transmit one chunk
     * @param session_id Upload session id
     * @param data Chunk index, bytes and checksum
     * @param token Cancelled when the upload is paused or cancelled
     *
     * Implementations may check @p token only before sending; a request
     * already on the wire runs to completion and pause or cancel takes
     * effect once it returns. http_upload_backend behaves this way.
     */
    [[nodiscard]] virtual auto upload_chunk(const std::string& session_id,
                                            const chunk& data,
                                            const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Assemble the uploaded chunks server-side
     */
    [[nodiscard]] virtual auto finalize_session(const std::string& session_id,
                                                const std::string& destination_id)
        -> result<finalize_result> = 0;

    /**
     * @brief Number of leading chunks the server holds for a session
     *
     * Used to reconcile local state before resuming. Backends that cannot
     * answer return not_available.
     */
    [[nodiscard]] virtual auto query_received_chunks(const std::string& session_id)
        -> result<uint64_t> {
        (void)session_id;
        return unexpected(error{error_code::not_available,
                                "backend cannot report received chunks"});
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_BACKEND_UPLOAD_BACKEND_H
