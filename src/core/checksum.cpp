/**
 * @file checksum.cpp
 * @brief Implementation of chunk checksums
 */

#include <kcenon/chunked_upload/core/checksum.h>

#include <array>
#include <cstdio>

namespace kcenon::chunked_upload {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32_POLYNOMIAL : crc >> 1;
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    uint32_t crc = 0xFFFFFFFF;

    for (auto byte : data) {
        auto index = (crc ^ static_cast<uint8_t>(byte)) & 0xFF;
        crc = (crc >> 8) ^ CRC32_TABLE[index];
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::to_hex(uint32_t value) -> std::string {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", value);
    return std::string(buf);
}

}  // namespace kcenon::chunked_upload
