/**
 * @file upload_id.h
 * @brief Upload and chunk identifiers
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_UPLOAD_ID_H
#define KCENON_CHUNKED_UPLOAD_CORE_UPLOAD_ID_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::chunked_upload {

/**
 * @brief Generate an upload id
 *
 * Format: <unix-ms>-<file name>-<file size>-<9 random base-36 chars>
 */
[[nodiscard]] auto generate_upload_id(std::string_view file_name, uint64_t file_size)
    -> std::string;

/**
 * @brief Identifier recorded for an acknowledged chunk ("chunk-<index>")
 */
[[nodiscard]] auto make_chunk_id(uint64_t index) -> std::string;

/**
 * @brief Parse the index out of a chunk identifier
 */
[[nodiscard]] auto parse_chunk_id(std::string_view id) -> std::optional<uint64_t>;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_UPLOAD_ID_H
