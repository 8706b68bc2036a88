/**
 * @file format_utils.h
 * @brief Human-readable rendering of sizes, speeds and durations
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_FORMAT_UTILS_H
#define KCENON_CHUNKED_UPLOAD_CORE_FORMAT_UTILS_H

#include <cstdint>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief "512 B/s", "1.5 KB/s" or "2.0 MB/s"
 */
[[nodiscard]] auto format_upload_speed(double bytes_per_second) -> std::string;

/**
 * @brief "45s", "2m" or "3h", rounded up
 */
[[nodiscard]] auto format_time_remaining(double seconds) -> std::string;

/**
 * @brief "0 B", "1 KB", "1.5 MB" (one decimal, trailing .0 dropped)
 */
[[nodiscard]] auto format_file_size(uint64_t bytes) -> std::string;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_FORMAT_UTILS_H
