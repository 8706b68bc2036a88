/**
 * @file upload_types.cpp
 * @brief Upload status parsing
 */

#include <kcenon/chunked_upload/core/upload_types.h>

#include <array>

namespace kcenon::chunked_upload {

auto upload_status_from_string(std::string_view name) -> std::optional<upload_status> {
    static constexpr std::array<upload_status, 6> all = {
        upload_status::pending, upload_status::uploading, upload_status::paused,
        upload_status::processing, upload_status::completed, upload_status::error};

    for (auto status : all) {
        if (name == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

}  // namespace kcenon::chunked_upload
