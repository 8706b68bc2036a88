/**
 * @file chunk_splitter.h
 * @brief Partitioning of a payload into fixed-size chunks
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SPLITTER_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SPLITTER_H

#include <kcenon/chunked_upload/core/byte_source.h>
#include <kcenon/chunked_upload/core/chunk_config.h>
#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Half-open byte range [start, end) of one chunk
 */
struct chunk_range {
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] auto length() const -> uint64_t { return end - start; }

    auto operator==(const chunk_range&) const -> bool = default;
};

/**
 * @brief One chunk read from a byte source
 */
struct chunk {
    uint64_t index = 0;
    uint64_t total_chunks = 0;
    uint64_t offset = 0;
    uint32_t checksum = 0;
    std::vector<std::byte> data;

    [[nodiscard]] auto is_first() const -> bool { return index == 0; }
    [[nodiscard]] auto is_last() const -> bool { return index + 1 == total_chunks; }
};

/**
 * @brief Splits payloads into chunks for upload
 *
 * The geometry functions are pure: chunk i covers
 * [i * chunk_size, min((i + 1) * chunk_size, file_size)).
 */
class chunk_splitter {
public:
    chunk_splitter();

    explicit chunk_splitter(const chunk_config& config);

    /**
     * @brief Number of chunks for a payload (0 for an empty payload)
     */
    [[nodiscard]] auto total_chunks(uint64_t file_size) const -> uint64_t;

    /**
     * @brief Byte range of chunk @p index
     * @return The range, or invalid_chunk_index if index >= total_chunks
     */
    [[nodiscard]] auto range(uint64_t file_size, uint64_t index) const
        -> result<chunk_range>;

    /**
     * @brief Read chunk @p index from a byte source
     * @return The chunk with its CRC32, or error
     */
    [[nodiscard]] auto read_chunk(byte_source& source, uint64_t index) const
        -> result<chunk>;

    [[nodiscard]] auto config() const -> const chunk_config&;

private:
    chunk_config config_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_SPLITTER_H
