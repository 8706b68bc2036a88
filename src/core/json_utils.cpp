/**
 * @file json_utils.cpp
 * @brief Implementation of the minimal JSON helpers
 */

#include <kcenon/chunked_upload/core/json_utils.h>

#include <charconv>
#include <iomanip>
#include <sstream>

namespace kcenon::chunked_upload::json_utils {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\n' || c == '\t' || c == '\r';
}

auto skip_space(std::string_view s, std::size_t pos) -> std::size_t {
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }
    return pos;
}

// Position just past the closing quote of the string starting at pos
auto end_of_string(std::string_view s, std::size_t pos) -> std::size_t {
    ++pos;
    while (pos < s.size()) {
        if (s[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (s[pos] == '"') {
            return pos + 1;
        }
        ++pos;
    }
    return std::string_view::npos;
}

// Position of the first character of the value for key, or npos
auto find_value(std::string_view json, std::string_view key) -> std::size_t {
    std::string needle;
    needle.reserve(key.size() + 2);
    needle += '"';
    needle += key;
    needle += '"';

    std::size_t from = 0;
    while (true) {
        auto key_pos = json.find(needle, from);
        if (key_pos == std::string_view::npos) {
            return std::string_view::npos;
        }

        auto colon = skip_space(json, key_pos + needle.size());
        if (colon < json.size() && json[colon] == ':') {
            return skip_space(json, colon + 1);
        }
        from = key_pos + needle.size();
    }
}

}  // namespace

auto escape_string(std::string_view s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                      << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            result += s[i];
            continue;
        }

        switch (s[i + 1]) {
            case '"': result += '"'; ++i; break;
            case '\\': result += '\\'; ++i; break;
            case '/': result += '/'; ++i; break;
            case 'b': result += '\b'; ++i; break;
            case 'f': result += '\f'; ++i; break;
            case 'n': result += '\n'; ++i; break;
            case 'r': result += '\r'; ++i; break;
            case 't': result += '\t'; ++i; break;
            case 'u':
                if (i + 5 < s.size()) {
                    unsigned int code = 0;
                    auto hex = s.substr(i + 2, 4);
                    std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                    result += static_cast<char>(code);
                    i += 5;
                }
                break;
            default: result += s[i]; break;
        }
    }
    return result;
}

auto extract_value(std::string_view json, std::string_view key) -> std::optional<std::string> {
    auto start = find_value(json, key);
    if (start == std::string_view::npos || start >= json.size()) {
        return std::nullopt;
    }

    if (json[start] == '"') {
        auto end = end_of_string(json, start);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return std::string(json.substr(start + 1, end - start - 2));
    }

    auto end = start;
    while (end < json.size() && json[end] != ',' && json[end] != '}' &&
           json[end] != ']' && json[end] != '\n') {
        ++end;
    }

    auto value = json.substr(start, end - start);
    while (!value.empty() && is_space(value.back())) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

auto extract_string(std::string_view json, std::string_view key) -> std::optional<std::string> {
    auto start = find_value(json, key);
    if (start == std::string_view::npos || start >= json.size() || json[start] != '"') {
        return std::nullopt;
    }
    auto raw = extract_value(json, key);
    if (!raw) {
        return std::nullopt;
    }
    return unescape_string(*raw);
}

auto extract_uint(std::string_view json, std::string_view key) -> std::optional<uint64_t> {
    auto raw = extract_value(json, key);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return value;
}

auto extract_bool(std::string_view json, std::string_view key) -> std::optional<bool> {
    auto raw = extract_value(json, key);
    if (!raw) {
        return std::nullopt;
    }
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return std::nullopt;
}

auto extract_string_array(std::string_view json, std::string_view key)
    -> std::optional<std::vector<std::string>> {
    auto pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '[') {
        return std::nullopt;
    }

    std::vector<std::string> items;
    pos = skip_space(json, pos + 1);
    while (pos < json.size() && json[pos] != ']') {
        if (json[pos] != '"') {
            return std::nullopt;
        }
        auto end = end_of_string(json, pos);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        items.push_back(unescape_string(json.substr(pos + 1, end - pos - 2)));

        pos = skip_space(json, end);
        if (pos < json.size() && json[pos] == ',') {
            pos = skip_space(json, pos + 1);
        }
    }

    if (pos >= json.size()) {
        return std::nullopt;
    }
    return items;
}

auto time_point_to_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto ms_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

auto session_to_json(const upload_session& session) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"id\": \"" << escape_string(session.id) << "\",\n";
    oss << "  \"file_name\": \"" << escape_string(session.file_name) << "\",\n";
    oss << "  \"file_size\": " << session.file_size << ",\n";
    oss << "  \"chunk_size\": " << session.chunk_size << ",\n";
    oss << "  \"total_chunks\": " << session.total_chunks << ",\n";
    oss << "  \"uploaded_chunks\": [";
    for (std::size_t i = 0; i < session.uploaded_chunks.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << escape_string(session.uploaded_chunks[i]) << "\"";
    }
    oss << "],\n";
    oss << "  \"created_at\": " << time_point_to_ms(session.created_at) << ",\n";
    oss << "  \"destination_id\": \"" << escape_string(session.destination_id) << "\"\n";
    oss << "}";
    return oss.str();
}

auto session_from_json(std::string_view json) -> result<upload_session> {
    upload_session session;

    auto id = extract_string(json, "id");
    if (!id || id->empty()) {
        return unexpected(error{error_code::state_store_error, "missing id field"});
    }
    session.id = *id;
    session.file_name = extract_string(json, "file_name").value_or("");
    session.destination_id = extract_string(json, "destination_id").value_or("");

    auto file_size = extract_uint(json, "file_size");
    auto chunk_size = extract_uint(json, "chunk_size");
    auto total_chunks = extract_uint(json, "total_chunks");
    auto created_at = extract_uint(json, "created_at");
    if (!file_size || !chunk_size || !total_chunks || !created_at) {
        return unexpected(error{error_code::state_store_error, "invalid numeric field"});
    }
    if (*chunk_size == 0) {
        return unexpected(error{error_code::state_store_error, "invalid chunk size"});
    }
    session.file_size = *file_size;
    session.chunk_size = *chunk_size;
    session.total_chunks = *total_chunks;
    session.created_at = ms_to_time_point(static_cast<int64_t>(*created_at));

    auto chunks = extract_string_array(json, "uploaded_chunks");
    if (!chunks) {
        return unexpected(error{error_code::state_store_error, "invalid uploaded_chunks field"});
    }
    if (chunks->size() > session.total_chunks) {
        return unexpected(error{error_code::state_store_error,
                                "more uploaded chunks than total chunks"});
    }
    session.uploaded_chunks = std::move(*chunks);

    return session;
}

}  // namespace kcenon::chunked_upload::json_utils
