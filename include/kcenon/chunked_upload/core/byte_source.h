/**
 * @file byte_source.h
 * @brief Random-access byte sources for upload payloads
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_BYTE_SOURCE_H
#define KCENON_CHUNKED_UPLOAD_CORE_BYTE_SOURCE_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief File-like payload of an upload
 *
 * The coordinator never keeps raw bytes across a pause, so a resumed
 * upload is handed a byte source again by its caller.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Display name of the payload (used in upload ids)
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Total size in bytes
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read up to @p length bytes starting at @p offset
     * @return The bytes read, or error if the range is not readable
     */
    [[nodiscard]] virtual auto read(uint64_t offset, std::size_t length)
        -> result<std::vector<std::byte>> = 0;
};

/**
 * @brief Byte source backed by a file on disk
 */
class file_byte_source : public byte_source {
public:
    /**
     * @brief Open a file for reading
     * @param path File path
     * @return The source, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::shared_ptr<file_byte_source>>;

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(uint64_t offset, std::size_t length)
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    file_byte_source(std::filesystem::path path, std::ifstream stream, uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t size_;
    std::mutex mutex_;
};

/**
 * @brief Byte source backed by an owned in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    memory_byte_source(std::string name, std::vector<std::byte> data);

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> uint64_t override;
    [[nodiscard]] auto read(uint64_t offset, std::size_t length)
        -> result<std::vector<std::byte>> override;

private:
    std::string name_;
    std::vector<std::byte> data_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_BYTE_SOURCE_H
