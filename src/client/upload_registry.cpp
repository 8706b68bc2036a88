/**
 * @file upload_registry.cpp
 * @brief Implementation of the upload registry
 */

#include <kcenon/chunked_upload/client/upload_registry.h>

#include <kcenon/chunked_upload/core/logging.h>

namespace kcenon::chunked_upload {

auto upload_registry::insert(std::shared_ptr<upload_entry> entry) -> result<void> {
    if (!entry) {
        return unexpected(error{error_code::internal_error, "null upload entry"});
    }

    std::string id;
    {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        id = entry->session.id;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(id, std::move(entry));
    if (!inserted) {
        return unexpected(error{error_code::invalid_state, "upload already tracked: " + id});
    }

    CU_LOG_TRACE(log_category::registry, "Tracking upload " + id);
    return {};
}

auto upload_registry::find(const std::string& id) const -> std::shared_ptr<upload_entry> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it != entries_.end() ? it->second : nullptr;
}

auto upload_registry::erase(const std::string& id) -> std::shared_ptr<upload_entry> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }

    auto entry = std::move(it->second);
    entries_.erase(it);
    CU_LOG_TRACE(log_category::registry, "Forgot upload " + id);
    return entry;
}

auto upload_registry::contains(const std::string& id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

auto upload_registry::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto upload_registry::ids() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(id);
    }
    return result;
}

auto upload_registry::entries() const -> std::vector<std::shared_ptr<upload_entry>> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<upload_entry>> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

auto upload_registry::snapshot(const std::string& id) const -> std::optional<upload_progress> {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->snapshot();
}

auto upload_registry::snapshots(const std::vector<std::string>& ids) const
    -> std::vector<upload_progress> {
    std::vector<upload_progress> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto progress = snapshot(id)) {
            result.push_back(std::move(*progress));
        }
    }
    return result;
}

auto upload_registry::all_snapshots() const -> std::vector<upload_progress> {
    // Entry locks are taken after the registry lock is released
    auto all = entries();
    std::vector<upload_progress> result;
    result.reserve(all.size());
    for (const auto& entry : all) {
        result.push_back(entry->snapshot());
    }
    return result;
}

}  // namespace kcenon::chunked_upload
