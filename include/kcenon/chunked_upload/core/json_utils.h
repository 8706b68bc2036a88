/**
 * @file json_utils.h
 * @brief Minimal JSON helpers shared by the session store and HTTP backend
 *
 * Handles the flat objects this library writes and the small responses it
 * reads back; it is not a general JSON parser.
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_JSON_UTILS_H
#define KCENON_CHUNKED_UPLOAD_CORE_JSON_UTILS_H

#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/core/upload_types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::chunked_upload::json_utils {

/**
 * @brief Escape a string for embedding between JSON quotes
 */
auto escape_string(std::string_view s) -> std::string;

/**
 * @brief Reverse escape_string()
 */
auto unescape_string(std::string_view s) -> std::string;

/**
 * @brief Raw value of a top-level key
 * @return String values unquoted (still escaped), other values trimmed;
 *         nullopt when the key is absent
 */
auto extract_value(std::string_view json, std::string_view key) -> std::optional<std::string>;

/**
 * @brief Unescaped string value of a key
 */
auto extract_string(std::string_view json, std::string_view key) -> std::optional<std::string>;

/**
 * @brief Unsigned integer value of a key
 */
auto extract_uint(std::string_view json, std::string_view key) -> std::optional<uint64_t>;

/**
 * @brief Boolean value of a key
 */
auto extract_bool(std::string_view json, std::string_view key) -> std::optional<bool>;

/**
 * @brief Array-of-strings value of a key
 */
auto extract_string_array(std::string_view json, std::string_view key)
    -> std::optional<std::vector<std::string>>;

auto time_point_to_ms(std::chrono::system_clock::time_point tp) -> int64_t;
auto ms_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point;

/**
 * @brief Serialize a session (pretty-printed, one field per line)
 */
auto session_to_json(const upload_session& session) -> std::string;

/**
 * @brief Parse a session written by session_to_json()
 */
auto session_from_json(std::string_view json) -> result<upload_session>;

}  // namespace kcenon::chunked_upload::json_utils

#endif  // KCENON_CHUNKED_UPLOAD_CORE_JSON_UTILS_H
