/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_CHUNKED_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_CHUNKED_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/chunked_upload/backend/upload_backend.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Backend that accepts everything without doing I/O
 *
 * Isolates coordinator overhead from transport cost.
 */
class null_upload_backend : public upload_backend {
public:
    auto initialize_session(const upload_session& session) -> result<void> override;
    auto upload_chunk(const std::string& session_id,
                      const chunk& data,
                      const cancellation_token& token) -> result<void> override;
    auto finalize_session(const std::string& session_id,
                          const std::string& destination_id) -> result<finalize_result> override;

    [[nodiscard]] auto bytes_received() const -> uint64_t { return bytes_.load(); }

private:
    std::atomic<uint64_t> bytes_{0};
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 10 * MB;    // 10 MB
constexpr std::size_t large_file = 64 * MB;     // 64 MB

constexpr std::size_t min_chunk = 64 * KB;      // 64 KB
constexpr std::size_t default_chunk = 1 * MB;   // 1 MB
constexpr std::size_t max_chunk = 8 * MB;       // 8 MB
}  // namespace sizes

}  // namespace kcenon::chunked_upload::benchmark

#endif  // KCENON_CHUNKED_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
