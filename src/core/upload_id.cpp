/**
 * @file upload_id.cpp
 * @brief Implementation of upload and chunk identifiers
 */

#include <kcenon/chunked_upload/core/upload_id.h>

#include <charconv>
#include <chrono>
#include <random>

namespace kcenon::chunked_upload {

namespace {

constexpr std::string_view base36_digits = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t random_suffix_length = 9;
constexpr std::string_view chunk_id_prefix = "chunk-";

}  // namespace

auto generate_upload_id(std::string_view file_name, uint64_t file_size) -> std::string {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::size_t> dis(0, base36_digits.size() - 1);

    std::string suffix;
    suffix.reserve(random_suffix_length);
    for (std::size_t i = 0; i < random_suffix_length; ++i) {
        suffix += base36_digits[dis(gen)];
    }

    std::string id = std::to_string(now_ms);
    id += '-';
    id += file_name;
    id += '-';
    id += std::to_string(file_size);
    id += '-';
    id += suffix;
    return id;
}

auto make_chunk_id(uint64_t index) -> std::string {
    return std::string(chunk_id_prefix) + std::to_string(index);
}

auto parse_chunk_id(std::string_view id) -> std::optional<uint64_t> {
    if (id.substr(0, chunk_id_prefix.size()) != chunk_id_prefix) {
        return std::nullopt;
    }

    auto digits = id.substr(chunk_id_prefix.size());
    uint64_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) {
        return std::nullopt;
    }
    return index;
}

}  // namespace kcenon::chunked_upload
