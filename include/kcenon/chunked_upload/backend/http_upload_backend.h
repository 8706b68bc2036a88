/**
 * @file http_upload_backend.h
 * @brief upload_backend speaking the REST upload protocol
 */

#ifndef KCENON_CHUNKED_UPLOAD_BACKEND_HTTP_UPLOAD_BACKEND_H
#define KCENON_CHUNKED_UPLOAD_BACKEND_HTTP_UPLOAD_BACKEND_H

#include <kcenon/chunked_upload/backend/http_client.h>
#include <kcenon/chunked_upload/backend/upload_backend.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Endpoints and transport settings of the HTTP backend
 */
struct http_backend_config {
    std::string base_url;                                   ///< e.g. "https://host"
    std::string sessions_path = "/api/upload-sessions";
    std::string chunk_path = "/api/upload-chunk";
    std::string finalize_path = "/api/finalize-upload";
    std::chrono::milliseconds timeout{30000};
    std::map<std::string, std::string> headers;             ///< Sent with every request

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief HTTP implementation of upload_backend
 *
 * - initialize: POST sessions_path with the session JSON
 * - upload chunk: POST chunk_path with the raw bytes and X-Upload-Session,
 *   X-Chunk-Index and X-Chunk-Checksum headers
 * - finalize: POST finalize_path with {"sessionId", "destinationId"}
 * - query: GET sessions_path/<id>, reading "received_chunks"
 */
class http_upload_backend : public upload_backend {
public:
    /**
     * @brief Create a backend
     * @param config Endpoint configuration
     * @param client HTTP client; a network_http_client is created if null
     */
    [[nodiscard]] static auto create(const http_backend_config& config,
                                     std::shared_ptr<http_client_interface> client = nullptr)
        -> result<std::unique_ptr<http_upload_backend>>;

    [[nodiscard]] auto initialize_session(const upload_session& session)
        -> result<void> override;

    [[nodiscard]] auto upload_chunk(const std::string& session_id,
                                    const chunk& data,
                                    const cancellation_token& token)
        -> result<void> override;

    [[nodiscard]] auto finalize_session(const std::string& session_id,
                                        const std::string& destination_id)
        -> result<finalize_result> override;

    [[nodiscard]] auto query_received_chunks(const std::string& session_id)
        -> result<uint64_t> override;

    [[nodiscard]] auto config() const -> const http_backend_config& { return config_; }

private:
    http_upload_backend(http_backend_config config,
                        std::shared_ptr<http_client_interface> client);

    [[nodiscard]] auto url_for(const std::string& path) const -> std::string;
    [[nodiscard]] auto headers_with(std::map<std::string, std::string> extra) const
        -> std::map<std::string, std::string>;

    http_backend_config config_;
    std::shared_ptr<http_client_interface> client_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_BACKEND_HTTP_UPLOAD_BACKEND_H
