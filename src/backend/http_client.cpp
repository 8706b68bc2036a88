/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 */

#include <kcenon/chunked_upload/backend/http_client.h>

#include <kcenon/chunked_upload/config/feature_flags.h>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::chunked_upload {

namespace {

[[maybe_unused]] auto not_available() -> unexpected {
    return unexpected{error{error_code::not_available,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
}

}  // namespace

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#endif
};

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

auto network_http_client::get(const std::string& url,
                              const std::map<std::string, std::string>& query,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, query, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP GET " + url + " failed"}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)query;
    (void)headers;
    return not_available();
#endif
}

auto network_http_client::post(const std::string& url,
                               const std::string& body,
                               const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP POST " + url + " failed"}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return not_available();
#endif
}

auto network_http_client::post(const std::string& url,
                               const std::vector<uint8_t>& body,
                               const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP POST " + url + " failed"}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return not_available();
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

}  // namespace kcenon::chunked_upload
