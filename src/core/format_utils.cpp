/**
 * @file format_utils.cpp
 * @brief Implementation of human-readable formatting helpers
 */

#include <kcenon/chunked_upload/core/format_utils.h>

#include <array>
#include <cmath>
#include <cstdio>

namespace kcenon::chunked_upload {

namespace {

constexpr double kib = 1024.0;
constexpr double mib = 1024.0 * 1024.0;

auto format_fixed(double value, int precision) -> std::string {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return std::string(buf);
}

}  // namespace

auto format_upload_speed(double bytes_per_second) -> std::string {
    if (bytes_per_second < kib) {
        return format_fixed(bytes_per_second, 0) + " B/s";
    }
    if (bytes_per_second < mib) {
        return format_fixed(bytes_per_second / kib, 1) + " KB/s";
    }
    return format_fixed(bytes_per_second / mib, 1) + " MB/s";
}

auto format_time_remaining(double seconds) -> std::string {
    if (seconds < 60.0) {
        return format_fixed(std::ceil(seconds), 0) + "s";
    }
    if (seconds < 3600.0) {
        return format_fixed(std::ceil(seconds / 60.0), 0) + "m";
    }
    return format_fixed(std::ceil(seconds / 3600.0), 0) + "h";
}

auto format_file_size(uint64_t bytes) -> std::string {
    if (bytes == 0) {
        return "0 B";
    }

    static constexpr std::array<const char*, 4> units = {"B", "KB", "MB", "GB"};

    std::size_t unit = 0;
    auto value = static_cast<double>(bytes);
    while (value >= kib && unit + 1 < units.size()) {
        value /= kib;
        ++unit;
    }

    auto text = format_fixed(value, 1);
    if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
        text.resize(text.size() - 2);
    }
    return text + " " + units[unit];
}

}  // namespace kcenon::chunked_upload
