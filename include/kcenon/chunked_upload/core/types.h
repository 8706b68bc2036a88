/**
 * @file types.h
 * @brief Core type definitions for chunked_upload_system
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::chunked_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Chunk and configuration errors (-100 to -119)
    invalid_chunk_size = -100,
    invalid_chunk_index = -101,
    invalid_configuration = -102,

    // Byte source errors (-120 to -139)
    file_not_found = -120,
    file_read_error = -121,

    // Upload lifecycle errors (-140 to -169)
    session_init_failed = -140,
    chunk_upload_failed = -141,
    finalize_failed = -142,
    invalid_state = -143,
    upload_not_found = -144,
    operation_cancelled = -145,
    already_running = -146,
    wait_timeout = -147,

    // Transport errors (-170 to -189)
    connection_failed = -170,
    http_error = -171,
    invalid_response = -172,
    not_available = -173,

    // Internal errors (-200 to -219)
    state_store_error = -200,
    internal_error = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::session_init_failed:
            return "upload session initialization failed";
        case error_code::chunk_upload_failed:
            return "chunk upload failed";
        case error_code::finalize_failed:
            return "upload finalization failed";
        case error_code::invalid_state:
            return "invalid upload state";
        case error_code::upload_not_found:
            return "upload not found";
        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::already_running:
            return "upload already running";
        case error_code::wait_timeout:
            return "wait timed out";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::http_error:
            return "http error";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::not_available:
            return "not available";
        case error_code::state_store_error:
            return "state store error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
