/**
 * @file chunked_upload.h
 * @brief Main header for chunked_upload_system library
 * @version 0.1.0
 *
 * Include this header to access the resumable upload client.
 *
 * @code
 * #include <kcenon/chunked_upload/chunked_upload.h>
 *
 * using namespace kcenon::chunked_upload;
 *
 * auto backend = http_upload_backend::create(
 *     http_backend_config{"https://uploads.example.com"});
 *
 * auto coordinator = upload_coordinator::builder()
 *     .with_backend(std::move(backend).value())
 *     .build();
 * @endcode
 */

#ifndef KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
#define KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/core/upload_types.h"
#include "kcenon/chunked_upload/core/byte_source.h"
#include "kcenon/chunked_upload/core/format_utils.h"
#include "kcenon/chunked_upload/core/progress_tracker.h"
#include "kcenon/chunked_upload/core/session_store.h"

// Backends
#include "kcenon/chunked_upload/backend/upload_backend.h"
#include "kcenon/chunked_upload/backend/http_upload_backend.h"

// Client
#include "kcenon/chunked_upload/client/upload_registry.h"
#include "kcenon/chunked_upload/client/upload_coordinator.h"

// Adapters
#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"

namespace kcenon::chunked_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
