/**
 * @file resume_upload.cpp
 * @brief Upload that survives interruption and process restarts
 *
 * This example demonstrates:
 * - Persisting upload sessions to a state directory
 * - Pausing an upload on Ctrl+C
 * - Restoring stored sessions and resuming where the server left off
 *
 * Run it, press Ctrl+C part way, then run the same command again.
 */

#include <kcenon/chunked_upload/chunked_upload.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace kcenon::chunked_upload;

namespace {

std::atomic<bool> pause_requested{false};

void signal_handler(int /*signal*/) {
    pause_requested = true;
}

void print_progress(const upload_progress& p) {
    std::cout << "\r[" << std::setw(9) << to_string(p.status) << "] " << std::fixed
              << std::setprecision(1) << std::setw(5) << p.progress_percent << "% ("
              << p.uploaded_chunks << "/" << p.total_chunks << " chunks)";
    if (p.speed_bps) {
        std::cout << "  " << format_upload_speed(*p.speed_bps);
    }
    std::cout << "    " << std::flush;
}

/**
 * @brief Find a stored upload of the same file
 */
auto find_stored_upload(upload_coordinator& coordinator,
                        const std::vector<std::string>& restored,
                        const byte_source& source) -> std::optional<std::string> {
    for (const auto& id : restored) {
        auto progress = coordinator.get_progress(id);
        if (progress && progress->file_name == source.name() &&
            progress->total_size == source.size()) {
            return id;
        }
    }
    return std::nullopt;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Resume Upload Example - Chunked Upload System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <destination_id>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --url <url>         Upload service base URL (default: http://localhost:8080)" << std::endl;
    std::cout << "  -s, --state-dir <dir>   Session state directory (default: ./.upload_state)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    http_backend_config backend_config;
    backend_config.base_url = "http://localhost:8080";
    std::filesystem::path state_dir = ".upload_state";
    std::string local_path;
    std::string destination_id;

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
        } else if (arg == "-s" || arg == "--state-dir") {
            if (++i >= argc) {
                std::cerr << "Error: --state-dir requires an argument" << std::endl;
                return 1;
            }
            state_dir = argv[i];
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

    std::signal(SIGINT, signal_handler);

    auto opened = file_byte_source::open(local_path);
    if (!opened) {
        std::cerr << "Error: " << opened.error().message << std::endl;
        return 1;
    }
    std::shared_ptr<byte_source> source = std::move(opened).value();

    auto backend = http_upload_backend::create(backend_config);
    if (!backend) {
        std::cerr << "Error: " << backend.error().message << std::endl;
        return 1;
    }

    auto built = upload_coordinator::builder()
                     .with_backend(std::move(backend).value())
                     .with_state_directory(state_dir)
                     .with_worker_count(1)
                     .build();
    if (!built) {
        std::cerr << "Error: failed to create coordinator: " << built.error().message
                  << std::endl;
        return 1;
    }
    auto& coordinator = built.value();

    auto restored = coordinator.restore_all();
    if (!restored) {
        std::cerr << "Error: " << restored.error().message << std::endl;
        return 1;
    }

    upload_options options;
    options.on_progress = print_progress;
    options.on_paused = [](const std::string& id) {
        std::cout << std::endl << "Paused " << id << ", run again to resume" << std::endl;
    };
    options.on_resumed = [](const std::string& id) {
        std::cout << "Resuming " << id << std::endl;
    };

    std::string file_id;
    if (auto stored = find_stored_upload(coordinator, restored.value(), *source)) {
        file_id = *stored;
        auto resumed = coordinator.resume(file_id, source, options);
        if (!resumed) {
            std::cerr << "Error: " << resumed.error().message << std::endl;
            return 1;
        }
    } else {
        auto submitted = coordinator.submit(source, destination_id, options);
        if (!submitted) {
            std::cerr << "Error: " << submitted.error().message << std::endl;
            return 1;
        }
        file_id = submitted.value();
        std::cout << "Started " << file_id << " (press Ctrl+C to pause)" << std::endl;
    }

    for (;;) {
        auto waited = coordinator.wait_for(file_id, std::chrono::milliseconds(200));
        if (waited) {
            const auto& progress = waited.value();
            if (progress.status == upload_status::completed) {
                std::cout << std::endl << "Upload completed" << std::endl;
                return 0;
            }
            if (progress.status == upload_status::error) {
                std::cerr << std::endl
                          << "Upload failed: " << progress.error_message.value_or("unknown")
                          << std::endl;
                return 1;
            }
            // Paused
            return 0;
        }
        if (waited.error().code != error_code::wait_timeout) {
            std::cerr << "Error: " << waited.error().message << std::endl;
            return 1;
        }

        if (pause_requested.exchange(false)) {
            if (auto paused = coordinator.pause(file_id); !paused) {
                std::cerr << std::endl
                          << "Cannot pause now: " << paused.error().message << std::endl;
            }
        }
    }
}
