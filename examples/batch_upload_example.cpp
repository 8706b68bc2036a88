/**
 * @file batch_upload_example.cpp
 * @brief Batch upload of several files sharing one worker pool
 *
 * This example demonstrates:
 * - Uploading multiple files in parallel
 * - Tracking aggregate progress across the batch
 * - Handling individual file failures within a batch
 */

#include <kcenon/chunked_upload/chunked_upload.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::chunked_upload;

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Chunked Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <destination_id> <file>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --url <url>         Upload service base URL (default: http://localhost:8080)" << std::endl;
    std::cout << "  -j, --jobs <n>          Concurrent uploads (default: 4)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    http_backend_config backend_config;
    backend_config.base_url = "http://localhost:8080";
    std::size_t jobs = 4;
    std::string destination_id;
    std::vector<std::filesystem::path> files;

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
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            jobs = std::stoul(argv[i]);
        } else if (destination_id.empty()) {
            destination_id = arg;
        } else {
            files.emplace_back(arg);
        }
    }

    if (destination_id.empty() || files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto backend = http_upload_backend::create(backend_config);
    if (!backend) {
        std::cerr << "Error: " << backend.error().message << std::endl;
        return 1;
    }

    auto built = upload_coordinator::builder()
                     .with_backend(std::move(backend).value())
                     .with_worker_count(jobs)
                     .build();
    if (!built) {
        std::cerr << "Error: failed to create coordinator: " << built.error().message
                  << std::endl;
        return 1;
    }
    auto& coordinator = built.value();

    upload_options options;
    options.on_error = [](const std::string& id, const error& err) {
        std::cerr << std::endl << "  " << id << " failed: " << err.message << std::endl;
    };

    std::vector<std::string> ids;
    for (const auto& path : files) {
        auto source = file_byte_source::open(path);
        if (!source) {
            std::cerr << "Skipping " << path << ": " << source.error().message << std::endl;
            continue;
        }
        auto id = coordinator.submit(std::move(source).value(), destination_id, options);
        if (!id) {
            std::cerr << "Skipping " << path << ": " << id.error().message << std::endl;
            continue;
        }
        ids.push_back(id.value());
    }

    std::cout << "Uploading " << ids.size() << " file(s) with " << jobs << " worker(s)"
              << std::endl;

    auto settled = [&]() {
        for (const auto& id : ids) {
            auto progress = coordinator.get_progress(id);
            if (progress && !is_terminal(progress->status)) {
                return false;
            }
        }
        return true;
    };

    while (!settled()) {
        auto aggregate = coordinator.get_aggregate_progress(ids);
        std::cout << "\r" << aggregate.completed_files << "/" << aggregate.total_files
                  << " files, " << std::fixed << std::setprecision(1)
                  << aggregate.overall_progress_percent << "% ("
                  << format_file_size(aggregate.uploaded_bytes) << " / "
                  << format_file_size(aggregate.total_bytes) << ")  "
                  << format_upload_speed(aggregate.average_speed) << "    " << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    std::cout << std::endl;

    std::size_t failed = 0;
    for (const auto& progress : coordinator.get_all_uploads()) {
        std::cout << "  " << std::left << std::setw(32) << progress.file_name << " "
                  << to_string(progress.status);
        if (progress.error_message) {
            std::cout << " (" << *progress.error_message << ")";
            ++failed;
        }
        std::cout << std::endl;
    }

    return failed == 0 ? 0 : 1;
}
