/**
 * @file session_store.cpp
 * @brief Implementation of the file-backed session store
 */

#include <kcenon/chunked_upload/core/session_store.h>

#include <kcenon/chunked_upload/core/json_utils.h>
#include <kcenon/chunked_upload/core/logging.h>

#include <cctype>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>

namespace kcenon::chunked_upload {

// ============================================================================
// session_store_config implementation
// ============================================================================

session_store_config::session_store_config()
    : state_directory(std::filesystem::temp_directory_path() / "chunked_upload_states") {}

session_store_config::session_store_config(std::filesystem::path dir)
    : state_directory(std::move(dir)) {}

namespace {

constexpr const char* state_file_extension = ".json";

auto sanitize_file_stem(const std::string& id) -> std::string {
    std::string stem;
    stem.reserve(id.size());
    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        stem += (std::isalnum(uc) || c == '-' || c == '_' || c == '.') ? c : '_';
    }
    return stem;
}

}  // namespace

// ============================================================================
// session_store::impl
// ============================================================================

class session_store::impl {
public:
    explicit impl(const session_store_config& cfg) : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.state_directory, ec);
        if (ec) {
            CU_LOG_WARN(log_category::store,
                        "Cannot create state directory " + config_.state_directory.string() +
                            ": " + ec.message());
        }
    }

    auto path_for(const std::string& id) const -> std::filesystem::path {
        return config_.state_directory / (sanitize_file_stem(id) + state_file_extension);
    }

    auto save(const upload_session& session) -> result<void> {
        std::unique_lock lock(mutex_);

        CU_LOG_DEBUG(log_category::store,
                     "Saving upload session: " + session.id + " (" +
                         std::to_string(session.uploaded_chunks.size()) + "/" +
                         std::to_string(session.total_chunks) + " chunks)");

        cache_[session.id] = session;

        std::error_code ec;
        std::filesystem::create_directories(config_.state_directory, ec);

        // Written to a temporary file, then renamed over the old state
        auto path = path_for(session.id);
        auto tmp_path = path;
        tmp_path += ".tmp";

        {
            std::ofstream file(tmp_path, std::ios::trunc);
            if (!file) {
                CU_LOG_ERROR(log_category::store,
                             "Failed to open state file for writing: " + tmp_path.string());
                return unexpected(error{error_code::state_store_error,
                                        "failed to open state file for writing"});
            }

            file << json_utils::session_to_json(session);
            if (!file) {
                CU_LOG_ERROR(log_category::store,
                             "Failed to write state file: " + tmp_path.string());
                return unexpected(
                    error{error_code::state_store_error, "failed to write state file"});
            }
        }

        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            CU_LOG_ERROR(log_category::store,
                         "Failed to replace state file: " + path.string() + " (" +
                             ec.message() + ")");
            return unexpected(error{error_code::state_store_error,
                                    "failed to replace state file: " + ec.message()});
        }

        CU_LOG_TRACE(log_category::store, "State persisted to: " + path.string());
        return {};
    }

    auto load(const std::string& id) -> result<upload_session> {
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(id);
            if (it != cache_.end()) {
                return it->second;
            }
        }

        auto path = path_for(id);
        auto loaded = read_file(path);
        if (!loaded) {
            return loaded;
        }

        if (loaded.value().id != id) {
            return unexpected(error{error_code::state_store_error,
                                    "state file " + path.string() + " belongs to " +
                                        loaded.value().id});
        }

        CU_LOG_DEBUG(log_category::store,
                     "Session recovered: " + id + " (" +
                         std::to_string(loaded.value().uploaded_chunks.size()) + "/" +
                         std::to_string(loaded.value().total_chunks) + " chunks)");

        {
            std::unique_lock lock(mutex_);
            cache_[id] = loaded.value();
        }
        return loaded;
    }

    auto remove(const std::string& id) -> result<void> {
        std::unique_lock lock(mutex_);

        cache_.erase(id);

        auto path = path_for(id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            CU_LOG_ERROR(log_category::store,
                         "Failed to delete state file: " + path.string() + " (" +
                             ec.message() + ")");
            return unexpected(error{error_code::state_store_error,
                                    "failed to delete state file: " + ec.message()});
        }

        CU_LOG_TRACE(log_category::store, "Session state removed: " + id);
        return {};
    }

    auto contains(const std::string& id) const -> bool {
        {
            std::shared_lock lock(mutex_);
            if (cache_.find(id) != cache_.end()) {
                return true;
            }
        }

        std::error_code ec;
        return std::filesystem::exists(path_for(id), ec);
    }

    auto list() -> std::vector<upload_session> {
        std::vector<upload_session> sessions;

        std::error_code ec;
        std::filesystem::directory_iterator it(config_.state_directory, ec);
        if (ec) {
            CU_LOG_WARN(log_category::store,
                        "Cannot list state directory: " + ec.message());
            return sessions;
        }

        for (const auto& entry : it) {
            if (!entry.is_regular_file(ec) ||
                entry.path().extension() != state_file_extension) {
                continue;
            }

            auto loaded = read_file(entry.path());
            if (!loaded) {
                CU_LOG_WARN(log_category::store,
                            "Skipping unreadable state file " + entry.path().string() +
                                ": " + loaded.error().message);
                continue;
            }

            {
                std::unique_lock lock(mutex_);
                cache_[loaded.value().id] = loaded.value();
            }
            sessions.push_back(std::move(loaded.value()));
        }

        return sessions;
    }

    auto config() const -> const session_store_config& { return config_; }

private:
    static auto read_file(const std::filesystem::path& path) -> result<upload_session> {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return unexpected(
                error{error_code::upload_not_found, "state file not found: " + path.string()});
        }

        std::ifstream file(path);
        if (!file) {
            return unexpected(
                error{error_code::state_store_error, "failed to open state file"});
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        return json_utils::session_from_json(oss.str());
    }

    session_store_config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, upload_session> cache_;
};

// ============================================================================
// session_store
// ============================================================================

session_store::session_store(const session_store_config& config)
    : impl_(std::make_unique<impl>(config)) {}

session_store::~session_store() = default;

session_store::session_store(session_store&&) noexcept = default;

auto session_store::operator=(session_store&&) noexcept -> session_store& = default;

auto session_store::save(const upload_session& session) -> result<void> {
    return impl_->save(session);
}

auto session_store::load(const std::string& id) -> result<upload_session> {
    return impl_->load(id);
}

auto session_store::remove(const std::string& id) -> result<void> {
    return impl_->remove(id);
}

auto session_store::contains(const std::string& id) const -> bool {
    return impl_->contains(id);
}

auto session_store::list() -> std::vector<upload_session> {
    return impl_->list();
}

auto session_store::config() const -> const session_store_config& {
    return impl_->config();
}

auto session_store::state_file_path(const std::string& id) const -> std::filesystem::path {
    return impl_->path_for(id);
}

}  // namespace kcenon::chunked_upload
