/**
 * @file http_upload_backend.cpp
 * @brief Implementation of the REST upload backend
 */

#include <kcenon/chunked_upload/backend/http_upload_backend.h>

#include <kcenon/chunked_upload/core/checksum.h>
#include <kcenon/chunked_upload/core/json_utils.h>
#include <kcenon/chunked_upload/core/logging.h>

#include <cctype>

namespace kcenon::chunked_upload {

namespace {

auto status_error(const std::string& what, const http_response& response) -> error {
    auto message = what + ": HTTP " + std::to_string(response.status_code);
    auto body = response.get_body_string();
    if (auto detail = json_utils::extract_string(body, "error")) {
        message += ": " + *detail;
    }
    return error{error_code::http_error, message};
}

auto url_encode(const std::string& value) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += c;
        } else {
            encoded += '%';
            encoded += hex[uc >> 4];
            encoded += hex[uc & 0x0F];
        }
    }
    return encoded;
}

}  // namespace

// ============================================================================
// http_backend_config
// ============================================================================

auto http_backend_config::validate() const -> result<void> {
    if (base_url.empty()) {
        return unexpected(error{error_code::invalid_configuration, "base_url is required"});
    }
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "base_url must start with http:// or https://"});
    }
    if (sessions_path.empty() || chunk_path.empty() || finalize_path.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "endpoint paths must not be empty"});
    }
    if (timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "timeout must be positive"});
    }
    return {};
}

// ============================================================================
// http_upload_backend
// ============================================================================

http_upload_backend::http_upload_backend(http_backend_config config,
                                         std::shared_ptr<http_client_interface> client)
    : config_(std::move(config)), client_(std::move(client)) {}

auto http_upload_backend::create(const http_backend_config& config,
                                 std::shared_ptr<http_client_interface> client)
    -> result<std::unique_ptr<http_upload_backend>> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    if (!client) {
        client = std::make_shared<network_http_client>(config.timeout);
    }

    return std::unique_ptr<http_upload_backend>(
        new http_upload_backend(config, std::move(client)));
}

auto http_upload_backend::url_for(const std::string& path) const -> std::string {
    auto base = config_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

auto http_upload_backend::headers_with(std::map<std::string, std::string> extra) const
    -> std::map<std::string, std::string> {
    for (const auto& [key, value] : config_.headers) {
        extra.emplace(key, value);
    }
    return extra;
}

auto http_upload_backend::initialize_session(const upload_session& session)
    -> result<void> {
    auto url = url_for(config_.sessions_path);
    CU_LOG_DEBUG(log_category::backend, "POST " + url + " for session " + session.id);

    auto response = client_->post(url, json_utils::session_to_json(session),
                                  headers_with({{"Content-Type", "application/json"}}));
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(status_error("session initialization rejected", response.value()));
    }
    return {};
}

auto http_upload_backend::upload_chunk(const std::string& session_id,
                                       const chunk& data,
                                       const cancellation_token& token) -> result<void> {
    if (token.is_cancelled()) {
        return unexpected(error{error_code::operation_cancelled, "chunk upload cancelled"});
    }

    std::vector<uint8_t> body(data.data.size());
    for (std::size_t i = 0; i < data.data.size(); ++i) {
        body[i] = static_cast<uint8_t>(data.data[i]);
    }

    auto headers = headers_with({
        {"Content-Type", "application/octet-stream"},
        {"X-Upload-Session", session_id},
        {"X-Chunk-Index", std::to_string(data.index)},
        {"X-Chunk-Checksum", checksum::to_hex(data.checksum)},
    });

    auto response = client_->post(url_for(config_.chunk_path), body, headers);
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(status_error("chunk " + std::to_string(data.index) + " rejected",
                                       response.value()));
    }

    auto response_body = response.value().get_body_string();
    if (json_utils::extract_bool(response_body, "success") == false) {
        auto detail = json_utils::extract_string(response_body, "error");
        return unexpected(error{error_code::chunk_upload_failed,
                                detail.value_or("chunk upload failed")});
    }

    return {};
}

auto http_upload_backend::finalize_session(const std::string& session_id,
                                           const std::string& destination_id)
    -> result<finalize_result> {
    auto url = url_for(config_.finalize_path);
    CU_LOG_DEBUG(log_category::backend, "POST " + url + " for session " + session_id);

    std::string body = "{\"sessionId\":\"" + json_utils::escape_string(session_id) +
                       "\",\"destinationId\":\"" +
                       json_utils::escape_string(destination_id) + "\"}";

    auto response = client_->post(url, body,
                                  headers_with({{"Content-Type", "application/json"}}));
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(status_error("finalize rejected", response.value()));
    }

    finalize_result result;
    result.body = response.value().get_body_string();

    auto id = json_utils::extract_string(result.body, "id");
    if (!id) {
        return unexpected(error{error_code::invalid_response,
                                "finalize response carries no id"});
    }
    result.id = *id;
    return result;
}

auto http_upload_backend::query_received_chunks(const std::string& session_id)
    -> result<uint64_t> {
    auto response = client_->get(url_for(config_.sessions_path + "/" + url_encode(session_id)), {},
                                 headers_with({}));
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(status_error("session query rejected", response.value()));
    }

    auto received = json_utils::extract_uint(response.value().get_body_string(),
                                             "received_chunks");
    if (!received) {
        return unexpected(error{error_code::invalid_response,
                                "session response carries no received_chunks"});
    }
    return *received;
}

}  // namespace kcenon::chunked_upload
