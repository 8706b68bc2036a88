/**
 * @file chunk_splitter.cpp
 * @brief Implementation of payload splitting into chunks
 */

#include <kcenon/chunked_upload/core/chunk_splitter.h>

#include <kcenon/chunked_upload/core/checksum.h>

#include <algorithm>

namespace kcenon::chunked_upload {

chunk_splitter::chunk_splitter() : config_() {}

chunk_splitter::chunk_splitter(const chunk_config& config) : config_(config) {}

auto chunk_splitter::total_chunks(uint64_t file_size) const -> uint64_t {
    return config_.calculate_chunk_count(file_size);
}

auto chunk_splitter::range(uint64_t file_size, uint64_t index) const
    -> result<chunk_range> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    if (index >= total_chunks(file_size)) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "chunk index " + std::to_string(index) + " out of range"});
    }

    chunk_range r;
    r.start = index * config_.chunk_size;
    r.end = std::min<uint64_t>(r.start + config_.chunk_size, file_size);
    return r;
}

auto chunk_splitter::read_chunk(byte_source& source, uint64_t index) const
    -> result<chunk> {
    auto file_size = source.size();

    auto r = range(file_size, index);
    if (!r) {
        return unexpected(r.error());
    }

    auto data = source.read(r.value().start, static_cast<std::size_t>(r.value().length()));
    if (!data) {
        return unexpected(data.error());
    }

    if (data.value().size() != r.value().length()) {
        return unexpected(
            error{error_code::file_read_error, "short read for chunk " + std::to_string(index)});
    }

    chunk c;
    c.index = index;
    c.total_chunks = total_chunks(file_size);
    c.offset = r.value().start;
    c.data = std::move(data.value());
    c.checksum = checksum::crc32(std::span<const std::byte>(c.data));

    return c;
}

auto chunk_splitter::config() const -> const chunk_config& {
    return config_;
}

}  // namespace kcenon::chunked_upload
