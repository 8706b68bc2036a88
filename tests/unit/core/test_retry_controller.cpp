/**
 * @file test_retry_controller.cpp
 * @brief Unit tests for retry_controller and cancellation
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/cancellation.h>
#include <kcenon/chunked_upload/core/retry_controller.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

using namespace std::chrono_literals;

namespace {

auto failure(const std::string& message) -> result<void> {
    return unexpected(error{error_code::http_error, message});
}

}  // namespace

// =============================================================================
// Backoff policy
// =============================================================================

TEST(RetryPolicyTest, BackoffDoublesPerRetry) {
    retry_policy policy{5, 100ms};

    EXPECT_EQ(policy.backoff_delay(0), 0ms);
    EXPECT_EQ(policy.backoff_delay(1), 100ms);
    EXPECT_EQ(policy.backoff_delay(2), 200ms);
    EXPECT_EQ(policy.backoff_delay(3), 400ms);
    EXPECT_EQ(policy.backoff_delay(4), 800ms);
}

TEST(RetryPolicyTest, BackoffDoesNotOverflow) {
    retry_policy policy{100, 1ms};
    EXPECT_EQ(policy.backoff_delay(64), policy.backoff_delay(31));
    EXPECT_GT(policy.backoff_delay(64), 0ms);
}

// =============================================================================
// Retry controller
// =============================================================================

class RetryControllerTest : public ::testing::Test {
protected:
    cancellation_source control_;
};

TEST_F(RetryControllerTest, FirstAttemptSuccess) {
    retry_controller controller(retry_policy{3, 1ms});
    int calls = 0;

    auto outcome = controller.run(0, control_, [&](const cancellation_token&) -> result<void> {
        ++calls;
        return {};
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().status, retry_status::completed);
    EXPECT_EQ(outcome.value().attempts, 1u);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryControllerTest, SucceedsAfterTransientFailures) {
    retry_controller controller(retry_policy{3, 1ms});
    int calls = 0;

    auto outcome = controller.run(4, control_, [&](const cancellation_token&) -> result<void> {
        if (++calls < 3) {
            return failure("HTTP 503");
        }
        return {};
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().status, retry_status::completed);
    EXPECT_EQ(outcome.value().attempts, 3u);
}

TEST_F(RetryControllerTest, ExhaustionMakesMaxPlusOneAttempts) {
    retry_controller controller(retry_policy{3, 1ms});
    int calls = 0;

    auto outcome = controller.run(7, control_, [&](const cancellation_token&) -> result<void> {
        ++calls;
        return failure("connection reset");
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(outcome.error().code, error_code::chunk_upload_failed);
    EXPECT_EQ(outcome.error().message,
              "failed to upload chunk 7 after 3 retries: connection reset");
}

TEST_F(RetryControllerTest, ZeroRetriesMeansSingleAttempt) {
    retry_controller controller(retry_policy{0, 1ms});
    int calls = 0;

    auto outcome = controller.run(0, control_, [&](const cancellation_token&) -> result<void> {
        ++calls;
        return failure("boom");
    });

    EXPECT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryControllerTest, HookReportsGrowingDelays) {
    retry_controller controller(retry_policy{3, 2ms});
    std::vector<std::pair<uint32_t, std::chrono::milliseconds>> events;
    controller.set_retry_hook(
        [&](uint32_t count, std::chrono::milliseconds delay, const error& last) {
            EXPECT_EQ(last.message, "HTTP 500");
            events.emplace_back(count, delay);
        });

    auto outcome = controller.run(1, control_, [](const cancellation_token&) {
        return failure("HTTP 500");
    });

    EXPECT_FALSE(outcome.has_value());
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], std::make_pair(1u, 2ms));
    EXPECT_EQ(events[1], std::make_pair(2u, 4ms));
    EXPECT_EQ(events[2], std::make_pair(3u, 8ms));
}

TEST_F(RetryControllerTest, CancelDuringBackoffInterruptsWithoutFurtherAttempts) {
    retry_controller controller(retry_policy{5, 10s});
    std::atomic<int> calls{0};

    std::thread canceller([this]() {
        std::this_thread::sleep_for(50ms);
        control_.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    auto outcome = controller.run(0, control_, [&](const cancellation_token&) {
        ++calls;
        return failure("timeout");
    });
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().status, retry_status::interrupted);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(RetryControllerTest, FailureAfterCancelIsNotCounted) {
    retry_controller controller(retry_policy{0, 1ms});

    auto outcome = controller.run(0, control_, [this](const cancellation_token& token) {
        control_.cancel();
        EXPECT_TRUE(token.is_cancelled());
        return failure("aborted");
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().status, retry_status::interrupted);
}

TEST_F(RetryControllerTest, CancelledBeforeStartMakesNoAttempt) {
    retry_controller controller(retry_policy{3, 1ms});
    control_.cancel();
    int calls = 0;

    auto outcome = controller.run(0, control_, [&](const cancellation_token&) -> result<void> {
        ++calls;
        return {};
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().status, retry_status::interrupted);
    EXPECT_EQ(calls, 0);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST(CancellationTest, LinkedSourceFollowsParent) {
    cancellation_source parent;
    auto child = parent.create_linked();

    EXPECT_FALSE(child.is_cancelled());
    parent.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_TRUE(child.token().is_cancelled());
}

TEST(CancellationTest, ChildCancelLeavesParentUntouched) {
    cancellation_source parent;
    auto child = parent.create_linked();

    child.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
}

TEST(CancellationTest, WaitForTimesOutWhenNotCancelled) {
    cancellation_source source;
    EXPECT_FALSE(source.token().wait_for(5ms));
}

TEST(CancellationTest, WaitForWakesOnCancel) {
    cancellation_source source;
    auto token = source.token();

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    canceller.join();
}

TEST(CancellationTest, CopiesShareState) {
    cancellation_source source;
    auto copy = source;

    copy.cancel();
    EXPECT_TRUE(source.is_cancelled());
}

}  // namespace kcenon::chunked_upload::test
