/**
 * @file cancellation.h
 * @brief Cooperative cancellation with interruptible waits
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CANCELLATION_H
#define KCENON_CHUNKED_UPLOAD_CORE_CANCELLATION_H

#include <chrono>
#include <memory>

namespace kcenon::chunked_upload {

namespace detail {
struct cancellation_state;
}  // namespace detail

/**
 * @brief Read side of a cancellation source
 *
 * A default-constructed token is never cancelled.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Block for @p delay or until cancellation, whichever comes first
     * @return true if the wait was cut short by cancellation
     */
    auto wait_for(std::chrono::milliseconds delay) const -> bool;

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state);

    std::shared_ptr<detail::cancellation_state> state_;
};

/**
 * @brief Owner side of a cancellation signal
 *
 * Linked sources are cancelled together with their parent but can also be
 * cancelled on their own without affecting it.
 */
class cancellation_source {
public:
    cancellation_source();

    /**
     * @brief Signal cancellation and wake every waiter (idempotent)
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto token() const -> cancellation_token;

    /**
     * @brief Create a child source cancelled whenever this one is
     */
    [[nodiscard]] auto create_linked() const -> cancellation_source;

private:
    std::shared_ptr<detail::cancellation_state> state_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CANCELLATION_H
