/**
 * @file cancellation.cpp
 * @brief Implementation of cancellation sources and tokens
 */

#include <kcenon/chunked_upload/core/cancellation.h>

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload {

namespace detail {

struct cancellation_state {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::vector<std::weak_ptr<cancellation_state>> children;

    void cancel() {
        std::vector<std::weak_ptr<cancellation_state>> to_cancel;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) {
                return;
            }
            cancelled = true;
            to_cancel.swap(children);
        }
        cv.notify_all();

        for (auto& weak : to_cancel) {
            if (auto child = weak.lock()) {
                child->cancel();
            }
        }
    }
};

}  // namespace detail

// cancellation_token

cancellation_token::cancellation_token(std::shared_ptr<detail::cancellation_state> state)
    : state_(std::move(state)) {}

auto cancellation_token::is_cancelled() const -> bool {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_token::wait_for(std::chrono::milliseconds delay) const -> bool {
    if (!state_) {
        std::this_thread::sleep_for(delay);
        return false;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, delay, [this] { return state_->cancelled; });
}

// cancellation_source

cancellation_source::cancellation_source()
    : state_(std::make_shared<detail::cancellation_state>()) {}

void cancellation_source::cancel() {
    state_->cancel();
}

auto cancellation_source::is_cancelled() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_source::token() const -> cancellation_token {
    return cancellation_token(state_);
}

auto cancellation_source::create_linked() const -> cancellation_source {
    cancellation_source child;

    bool parent_cancelled = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        parent_cancelled = state_->cancelled;
        if (!parent_cancelled) {
            // Drop links to children that no longer exist
            std::erase_if(state_->children,
                          [](const auto& weak) { return weak.expired(); });
            state_->children.push_back(child.state_);
        }
    }

    if (parent_cancelled) {
        child.cancel();
    }
    return child;
}

}  // namespace kcenon::chunked_upload
