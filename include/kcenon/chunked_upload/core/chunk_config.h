/**
 * @file chunk_config.h
 * @brief Chunk geometry for uploads
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_CONFIG_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_CONFIG_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Configuration for chunk operations
 */
struct chunk_config {
    /// Default chunk size (1MiB)
    static constexpr std::size_t default_chunk_size = 1024 * 1024;

    /// Chunk size to use for splitting
    std::size_t chunk_size = default_chunk_size;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size must be greater than zero"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     * @param file_size Size of the file in bytes
     * @return Number of chunks needed (0 for an empty file)
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0 || chunk_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_CONFIG_H
