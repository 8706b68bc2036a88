/**
 * @file byte_source.cpp
 * @brief Implementation of file and memory byte sources
 */

#include <kcenon/chunked_upload/core/byte_source.h>

#include <algorithm>

namespace kcenon::chunked_upload {

// file_byte_source

file_byte_source::file_byte_source(std::filesystem::path path,
                                   std::ifstream stream,
                                   uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

auto file_byte_source::open(const std::filesystem::path& path)
    -> result<std::shared_ptr<file_byte_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_read_error, "cannot get file size: " + path.string()});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    return std::shared_ptr<file_byte_source>(
        new file_byte_source(path, std::move(stream), size));
}

auto file_byte_source::name() const -> std::string {
    return path_.filename().string();
}

auto file_byte_source::size() const -> uint64_t {
    return size_;
}

auto file_byte_source::read(uint64_t offset, std::size_t length)
    -> result<std::vector<std::byte>> {
    if (offset > size_) {
        return unexpected(error{error_code::file_read_error, "read offset past end of file"});
    }

    auto bytes_to_read = static_cast<std::size_t>(
        std::min<uint64_t>(length, size_ - offset));
    std::vector<std::byte> buffer(bytes_to_read);
    if (bytes_to_read == 0) {
        return buffer;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(bytes_to_read));
    if (static_cast<std::size_t>(stream_.gcount()) != bytes_to_read) {
        return unexpected(
            error{error_code::file_read_error, "failed to read expected bytes"});
    }

    return buffer;
}

// memory_byte_source

memory_byte_source::memory_byte_source(std::string name, std::vector<std::byte> data)
    : name_(std::move(name)), data_(std::move(data)) {}

auto memory_byte_source::name() const -> std::string {
    return name_;
}

auto memory_byte_source::size() const -> uint64_t {
    return data_.size();
}

auto memory_byte_source::read(uint64_t offset, std::size_t length)
    -> result<std::vector<std::byte>> {
    if (offset > data_.size()) {
        return unexpected(error{error_code::file_read_error, "read offset past end of buffer"});
    }

    auto end = offset + std::min<uint64_t>(length, data_.size() - offset);
    return std::vector<std::byte>(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                                  data_.begin() + static_cast<std::ptrdiff_t>(end));
}

}  // namespace kcenon::chunked_upload
