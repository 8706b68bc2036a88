/**
 * @file checksum.h
 * @brief Chunk integrity checksums
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHECKSUM_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief CRC32 (IEEE 802.3) utilities
 *
 * Every chunk read for upload carries a CRC32 of its payload, which the
 * HTTP backend sends alongside the bytes so the server can reject
 * corrupted chunks.
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     * @param data Input data span
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Verify CRC32 checksum of data
     */
    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;

    /**
     * @brief Render a CRC32 as eight lower-case hex digits
     */
    [[nodiscard]] static auto to_hex(uint32_t value) -> std::string;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHECKSUM_H
