/**
 * @file upload_example.cpp
 * @brief Chunked upload of a single file with progress and retry reporting
 *
 * This example demonstrates:
 * - Configuring the HTTP upload backend
 * - Using progress and retry callbacks to monitor an upload
 * - Comprehensive error handling patterns
 * - Blocking on start() until the upload finishes
 */

#include <kcenon/chunked_upload/chunked_upload.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::chunked_upload;

namespace {

/**
 * @brief Create a test file with pattern content for demonstration
 */
void create_test_file(const std::filesystem::path& path, size_t size) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path.string());
    }

    std::vector<char> buffer(std::min(size, size_t{65536}));
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }

    std::cout << "Created test file: " << path << " (" << format_file_size(size) << ")"
              << std::endl;
}

auto parse_size(const std::string& size_str) -> size_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<size_t>(value * 1024);
            case 'M': return static_cast<size_t>(value * 1024 * 1024);
            case 'G': return static_cast<size_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<size_t>(value);
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Chunked Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <destination_id>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --url <url>         Upload service base URL (default: http://localhost:8080)" << std::endl;
    std::cout << "  -c, --chunk-size <size> Chunk size (e.g., 512K, 4M; default: 1M)" << std::endl;
    std::cout << "  -r, --retries <n>       Retries per chunk (default: 3)" << std::endl;
    std::cout << "  -H, --header <k=v>      Extra request header, may repeat" << std::endl;
    std::cout << "  --create-test <size>    Create test file of specified size (e.g., 10M, 1G)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " report.pdf folder-42" << std::endl;
    std::cout << "  " << program << " -u https://files.example.com -c 4M video.mp4 media" << std::endl;
    std::cout << "  " << program << " --create-test 100M test_data.bin scratch" << std::endl;
}

int main(int argc, char* argv[]) {
    http_backend_config backend_config;
    backend_config.base_url = "http://localhost:8080";
    upload_options options;
    std::string local_path;
    std::string destination_id;
    std::optional<size_t> create_test_size;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-u" || arg == "--url") {
            if (++i >= argc) {
                std::cerr << "Error: --url requires an argument" << std::endl;
                return 1;
            }
            backend_config.base_url = argv[i];
        } else if (arg == "-c" || arg == "--chunk-size") {
            if (++i >= argc) {
                std::cerr << "Error: --chunk-size requires an argument" << std::endl;
                return 1;
            }
            options.chunk_size = parse_size(argv[i]);
        } else if (arg == "-r" || arg == "--retries") {
            if (++i >= argc) {
                std::cerr << "Error: --retries requires an argument" << std::endl;
                return 1;
            }
            options.max_retries = static_cast<uint32_t>(std::stoul(argv[i]));
        } else if (arg == "-H" || arg == "--header") {
            if (++i >= argc) {
                std::cerr << "Error: --header requires an argument" << std::endl;
                return 1;
            }
            std::string header = argv[i];
            auto eq = header.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Error: header must be key=value" << std::endl;
                return 1;
            }
            backend_config.headers[header.substr(0, eq)] = header.substr(eq + 1);
        } else if (arg == "--create-test") {
            if (++i >= argc) {
                std::cerr << "Error: --create-test requires an argument" << std::endl;
                return 1;
            }
            create_test_size = parse_size(argv[i]);
        } else if (local_path.empty()) {
            local_path = arg;
        } else if (destination_id.empty()) {
            destination_id = arg;
        } else {
            std::cerr << "Error: unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (local_path.empty() || destination_id.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (create_test_size) {
        create_test_file(local_path, *create_test_size);
    }

    auto source = file_byte_source::open(local_path);
    if (!source) {
        std::cerr << "Error: " << source.error().message << std::endl;
        return 1;
    }

    auto backend = http_upload_backend::create(backend_config);
    if (!backend) {
        std::cerr << "Error: " << backend.error().message << std::endl;
        return 1;
    }

    auto coordinator = upload_coordinator::builder()
                           .with_backend(std::move(backend).value())
                           .with_worker_count(1)
                           .build();
    if (!coordinator) {
        std::cerr << "Error: failed to create coordinator: " << coordinator.error().message
                  << std::endl;
        return 1;
    }

    options.on_progress = [](const upload_progress& p) {
        std::cout << "\r[" << std::fixed << std::setprecision(1) << std::setw(5)
                  << p.progress_percent << "%] "
                  << format_file_size(p.uploaded_bytes) << " / "
                  << format_file_size(p.total_size);
        if (p.speed_bps) {
            std::cout << "  " << format_upload_speed(*p.speed_bps);
        }
        if (p.eta_seconds) {
            std::cout << "  ETA " << format_time_remaining(*p.eta_seconds);
        }
        std::cout << "    " << std::flush;
    };
    options.on_retry = [](const retry_event& e) {
        std::cout << std::endl
                  << "Chunk " << e.chunk_index << " failed (" << e.last_error.message
                  << "), retry " << e.retry_count << " in " << e.delay.count() << " ms"
                  << std::endl;
    };

    std::cout << "Uploading " << local_path << " to " << backend_config.base_url
              << " (destination " << destination_id << ")" << std::endl;

    auto result = coordinator.value().start(std::move(source).value(), destination_id, options);
    std::cout << std::endl;

    if (!result) {
        const auto& err = result.error();
        std::cerr << "Upload failed: " << err.message << " (" << to_string(err.code) << ")"
                  << std::endl;
        return 1;
    }

    std::cout << "Upload completed, artifact id: " << result.value() << std::endl;
    return 0;
}
