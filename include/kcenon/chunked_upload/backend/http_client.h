/**
 * @file http_client.h
 * @brief HTTP client abstraction used by the HTTP upload backend
 *
 * network_http_client wraps the network_system HTTP client. Tests inject
 * their own http_client_interface implementation.
 */

#ifndef KCENON_CHUNKED_UPLOAD_BACKEND_HTTP_CLIENT_H
#define KCENON_CHUNKED_UPLOAD_BACKEND_HTTP_CLIENT_H

#include <kcenon/chunked_upload/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::chunked_upload {

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Minimal HTTP client interface
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto get(const std::string& url,
                     const std::map<std::string, std::string>& query,
                     const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::vector<uint8_t>& body,
                      const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief http_client_interface over network_system
 *
 * Without network_system every request fails with not_available.
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::vector<uint8_t>& body,
                            const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if network_system support is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_BACKEND_HTTP_CLIENT_H
