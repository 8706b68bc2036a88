/**
 * @file test_upload_coordinator.cpp
 * @brief Unit tests for upload_coordinator (submit/pause/resume/cancel/restore)
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/client/upload_coordinator.h>
#include <kcenon/chunked_upload/core/session_store.h>

#include "mock_upload_backend.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <numeric>
#include <random>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

using namespace std::chrono_literals;

namespace {

constexpr std::size_t chunk_size = 1024;

auto iota_indices(uint64_t count) -> std::vector<uint64_t> {
    std::vector<uint64_t> indices(count);
    std::iota(indices.begin(), indices.end(), 0);
    return indices;
}

}  // namespace

class UploadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<mock_upload_backend>();
        state_dir_ = std::filesystem::temp_directory_path() /
                     ("chunked_upload_test_coordinator_" +
                      std::to_string(std::random_device{}()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(state_dir_, ec);
    }

    auto build(bool persistent = false) -> upload_coordinator {
        auto builder = upload_coordinator::builder()
                           .with_backend(backend_)
                           .with_worker_count(2);
        if (persistent) {
            builder.with_state_directory(state_dir_);
        }
        auto built = builder.build();
        EXPECT_TRUE(built.has_value()) << built.error().message;
        return std::move(built).value();
    }

    static auto fast_options() -> upload_options {
        upload_options options;
        options.chunk_size = chunk_size;
        options.retry_delay = 1ms;
        return options;
    }

    std::shared_ptr<mock_upload_backend> backend_;
    std::filesystem::path state_dir_;
};

// ============================================================================
// Builder
// ============================================================================

TEST_F(UploadCoordinatorTest, BuilderRequiresBackend) {
    auto built = upload_coordinator::builder().build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(UploadCoordinatorTest, BuilderRejectsZeroCheckpointInterval) {
    auto built = upload_coordinator::builder()
                     .with_backend(backend_)
                     .with_checkpoint_interval(0)
                     .build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(UploadCoordinatorTest, SubmitRejectsInvalidOptions) {
    auto coordinator = build();
    upload_options options;
    options.chunk_size = 0;

    auto id = coordinator.submit(make_source("a.bin", 10), "dest", options);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::invalid_chunk_size);

    auto missing = coordinator.submit(nullptr, "dest", fast_options());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::invalid_configuration);
}

// ============================================================================
// Happy path
// ============================================================================

TEST_F(UploadCoordinatorTest, UploadsChunksInOrderAndFinalizes) {
    std::mutex mutex;
    std::vector<double> percents;
    std::atomic<int> completions{0};
    std::string completed_id;

    auto coordinator = build();
    auto source = make_source("video.mp4", 10 * chunk_size - 100);

    auto options = fast_options();
    options.on_progress = [&](const upload_progress& p) {
        std::lock_guard<std::mutex> lock(mutex);
        percents.push_back(p.progress_percent);
    };
    options.on_complete = [&](const std::string&, const finalize_result& r) {
        std::lock_guard<std::mutex> lock(mutex);
        completed_id = r.id;
        ++completions;
    };

    auto id = coordinator.submit(source, "collection-9", options);
    ASSERT_TRUE(id.has_value());

    auto progress = coordinator.wait_for(id.value());
    ASSERT_TRUE(progress.has_value());

    EXPECT_EQ(progress.value().status, upload_status::completed);
    EXPECT_DOUBLE_EQ(progress.value().progress_percent, 100.0);
    EXPECT_EQ(progress.value().uploaded_bytes, source->size());
    EXPECT_EQ(progress.value().total_chunks, 10u);

    EXPECT_EQ(backend_->init_calls(), 1);
    EXPECT_EQ(backend_->finalize_calls(), 1);
    EXPECT_EQ(backend_->last_destination(), "collection-9");
    EXPECT_EQ(backend_->accepted_chunks(), iota_indices(10));

    auto assembled = backend_->assembled();
    auto original = source->read(0, source->size());
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(assembled, original.value());

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(completions.load(), 1);
    EXPECT_EQ(completed_id, "final-" + id.value());
    ASSERT_FALSE(percents.empty());
    EXPECT_TRUE(std::is_sorted(percents.begin(), percents.end()));
    EXPECT_DOUBLE_EQ(percents.back(), 100.0);
}

TEST_F(UploadCoordinatorTest, StartReturnsFinalizeId) {
    auto coordinator = build();

    auto finalized = coordinator.start(make_source("doc.pdf", 3000), "dest", fast_options());

    ASSERT_TRUE(finalized.has_value());
    EXPECT_EQ(finalized.value().rfind("final-", 0), 0u);
    EXPECT_EQ(backend_->accepted_chunks().size(), 3u);
}

TEST_F(UploadCoordinatorTest, EmptyFileSkipsChunksAndFinalizes) {
    auto coordinator = build();

    auto id = coordinator.submit(make_source("empty.txt", 0), "dest", fast_options());
    ASSERT_TRUE(id.has_value());
    auto progress = coordinator.wait_for(id.value());

    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress.value().status, upload_status::completed);
    EXPECT_DOUBLE_EQ(progress.value().progress_percent, 100.0);
    EXPECT_TRUE(backend_->accepted_chunks().empty());
    EXPECT_EQ(backend_->finalize_calls(), 1);
}

// ============================================================================
// Pause / resume
// ============================================================================

TEST_F(UploadCoordinatorTest, PauseAfterThirdChunkThenResumeFromFourth) {
    std::atomic<int> paused_events{0};
    std::atomic<int> resumed_events{0};

    auto coordinator = build();
    auto source = make_source("big.bin", 10 * chunk_size);

    auto options = fast_options();
    options.on_progress = [&](const upload_progress& p) {
        if (p.uploaded_chunks == 3) {
            EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
        }
    };
    options.on_paused = [&](const std::string&) { ++paused_events; };
    options.on_resumed = [&](const std::string&) { ++resumed_events; };

    auto id = coordinator.submit(source, "dest", options);
    ASSERT_TRUE(id.has_value());

    auto paused = coordinator.wait_for(id.value());
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused.value().status, upload_status::paused);
    EXPECT_EQ(paused.value().uploaded_chunks, 3u);
    EXPECT_EQ(backend_->accepted_chunks(), iota_indices(3));
    EXPECT_EQ(backend_->finalize_calls(), 0);
    EXPECT_EQ(paused_events.load(), 1);

    // Pausing again is a no-op
    EXPECT_TRUE(coordinator.pause(id.value()).has_value());
    EXPECT_EQ(paused_events.load(), 1);

    ASSERT_TRUE(coordinator.resume(id.value(), source, options).has_value());
    auto done = coordinator.wait_for(id.value());

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::completed);
    EXPECT_EQ(resumed_events.load(), 1);
    EXPECT_EQ(backend_->accepted_chunks(), iota_indices(10));
    EXPECT_EQ(backend_->attempts(3), 1);
    EXPECT_EQ(backend_->init_calls(), 1);
}

TEST_F(UploadCoordinatorTest, PauseInterruptsRetryBackoff) {
    auto coordinator = build();

    backend_->set_chunk_hook([](uint64_t index, const cancellation_token&) -> result<void> {
        if (index == 0) {
            return unexpected(error{error_code::http_error, "HTTP 503"});
        }
        return {};
    });

    auto options = fast_options();
    options.retry_delay = 10s;
    options.on_retry = [&](const retry_event& e) {
        EXPECT_TRUE(coordinator.pause(e.file_id).has_value());
    };

    auto started = std::chrono::steady_clock::now();
    auto id = coordinator.submit(make_source("a.bin", 2 * chunk_size), "dest", options);
    ASSERT_TRUE(id.has_value());

    auto paused = coordinator.wait_for(id.value(), 5s);
    ASSERT_TRUE(paused.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(paused.value().status, upload_status::paused);
    EXPECT_EQ(paused.value().uploaded_chunks, 0u);
    EXPECT_EQ(backend_->attempts(0), 1);
}

TEST_F(UploadCoordinatorTest, ResumeWithAllChunksAcknowledgedOnlyFinalizes) {
    auto coordinator = build();
    auto source = make_source("c.bin", 4 * chunk_size);

    auto options = fast_options();
    options.on_progress = [&](const upload_progress& p) {
        if (p.uploaded_chunks == p.total_chunks && p.status != upload_status::completed) {
            EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
        }
    };

    auto id = coordinator.submit(source, "dest", options);
    ASSERT_TRUE(id.has_value());

    auto paused = coordinator.wait_for(id.value());
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused.value().status, upload_status::paused);
    EXPECT_EQ(backend_->finalize_calls(), 0);

    ASSERT_TRUE(coordinator.resume(id.value(), source, fast_options()).has_value());
    auto done = coordinator.wait_for(id.value());

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::completed);
    EXPECT_EQ(backend_->finalize_calls(), 1);
    EXPECT_EQ(backend_->total_attempts(), 4);
}

TEST_F(UploadCoordinatorTest, InvalidStateTransitionsAreRejected) {
    auto coordinator = build();
    auto source = make_source("d.bin", 2 * chunk_size);

    auto unknown = coordinator.pause("no-such-upload");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, error_code::upload_not_found);

    auto id = coordinator.submit(source, "dest", fast_options());
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(coordinator.wait_for(id.value()).has_value());

    auto pause_done = coordinator.pause(id.value());
    ASSERT_FALSE(pause_done.has_value());
    EXPECT_EQ(pause_done.error().code, error_code::invalid_state);

    auto resume_done = coordinator.resume(id.value(), source, fast_options());
    ASSERT_FALSE(resume_done.has_value());
    EXPECT_EQ(resume_done.error().code, error_code::invalid_state);
}

TEST_F(UploadCoordinatorTest, ResumeRejectsDifferentSource) {
    auto coordinator = build();
    auto source = make_source("e.bin", 6 * chunk_size);

    auto options = fast_options();
    options.on_progress = [&](const upload_progress& p) {
        if (p.uploaded_chunks == 1) {
            EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
        }
    };

    auto id = coordinator.submit(source, "dest", options);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(coordinator.wait_for(id.value()).has_value());

    auto resumed = coordinator.resume(id.value(), make_source("e.bin", 100), fast_options());
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::invalid_configuration);

    auto progress = coordinator.get_progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, upload_status::paused);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_F(UploadCoordinatorTest, CancelDuringBackoffForgetsUpload) {
    std::atomic<int> errors{0};

    auto coordinator = build();

    backend_->set_chunk_hook([](uint64_t, const cancellation_token&) -> result<void> {
        return unexpected(error{error_code::http_error, "HTTP 500"});
    });

    auto options = fast_options();
    options.max_retries = 5;
    options.retry_delay = 10s;
    options.on_error = [&](const std::string&, const error&) { ++errors; };
    options.on_retry = [&](const retry_event& e) { coordinator.cancel(e.file_id); };

    auto id = coordinator.submit(make_source("f.bin", 3 * chunk_size), "dest", options);
    ASSERT_TRUE(id.has_value());

    std::this_thread::sleep_for(200ms);

    EXPECT_FALSE(coordinator.get_progress(id.value()).has_value());
    EXPECT_EQ(coordinator.registry()->size(), 0u);
    EXPECT_EQ(backend_->attempts(0), 1);
    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(backend_->finalize_calls(), 0);

    auto waited = coordinator.wait_for(id.value());
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::upload_not_found);

    // Cancelling an unknown or already cancelled upload is harmless
    coordinator.cancel(id.value());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(UploadCoordinatorTest, ExhaustedRetriesFailUpload) {
    std::mutex mutex;
    std::vector<retry_event> retries;
    std::optional<error> reported;

    auto coordinator = build();

    backend_->set_chunk_hook([](uint64_t index, const cancellation_token&) -> result<void> {
        if (index == 2) {
            return unexpected(error{error_code::http_error, "HTTP 500"});
        }
        return {};
    });

    auto options = fast_options();
    options.max_retries = 2;
    options.on_retry = [&](const retry_event& e) {
        std::lock_guard<std::mutex> lock(mutex);
        retries.push_back(e);
    };
    options.on_error = [&](const std::string&, const error& err) {
        std::lock_guard<std::mutex> lock(mutex);
        reported = err;
    };

    auto id = coordinator.submit(make_source("g.bin", 5 * chunk_size), "dest", options);
    ASSERT_TRUE(id.has_value());
    auto progress = coordinator.wait_for(id.value());

    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress.value().status, upload_status::error);
    EXPECT_EQ(progress.value().uploaded_chunks, 2u);
    EXPECT_EQ(backend_->attempts(2), 3);
    EXPECT_EQ(backend_->attempts(3), 0);
    EXPECT_EQ(backend_->finalize_calls(), 0);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_TRUE(reported.has_value());
    EXPECT_EQ(reported->code, error_code::chunk_upload_failed);
    EXPECT_EQ(reported->message, "failed to upload chunk 2 after 2 retries: HTTP 500");

    ASSERT_EQ(retries.size(), 2u);
    EXPECT_EQ(retries[0].chunk_index, 2u);
    EXPECT_EQ(retries[0].retry_count, 1u);
    EXPECT_EQ(retries[0].delay, 1ms);
    EXPECT_EQ(retries[1].delay, 2ms);

    auto again = coordinator.retry_finalize(id.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state);
}

TEST_F(UploadCoordinatorTest, ZeroRetriesFailsOnFirstError) {
    auto coordinator = build();
    backend_->set_chunk_hook([](uint64_t, const cancellation_token&) -> result<void> {
        return unexpected(error{error_code::connection_failed, "refused"});
    });

    auto options = fast_options();
    options.max_retries = 0;

    auto finalized = coordinator.start(make_source("h.bin", chunk_size), "dest", options);

    ASSERT_FALSE(finalized.has_value());
    EXPECT_EQ(finalized.error().code, error_code::chunk_upload_failed);
    EXPECT_EQ(backend_->attempts(0), 1);
}

TEST_F(UploadCoordinatorTest, InitializationFailureStopsBeforeChunks) {
    auto coordinator = build();
    backend_->set_init_hook([](const upload_session&) -> result<void> {
        return unexpected(error{error_code::http_error, "HTTP 401"});
    });

    auto finalized = coordinator.start(make_source("i.bin", 4 * chunk_size), "dest",
                                       fast_options());

    ASSERT_FALSE(finalized.has_value());
    EXPECT_EQ(finalized.error().code, error_code::session_init_failed);
    EXPECT_EQ(finalized.error().message, "failed to initialize upload session: HTTP 401");
    EXPECT_EQ(backend_->total_attempts(), 0);
    EXPECT_EQ(backend_->finalize_calls(), 0);
}

TEST_F(UploadCoordinatorTest, PauseDuringFailingInitLeavesTerminalError) {
    std::promise<void> entered;
    std::promise<void> release;
    auto entered_future = entered.get_future();
    auto release_future = release.get_future().share();

    backend_->set_init_hook([&entered, release_future](const upload_session&) -> result<void> {
        entered.set_value();
        release_future.wait();
        return unexpected(error{error_code::connection_failed, "connection refused"});
    });

    std::atomic<int> errors{0};
    auto options = fast_options();
    options.on_error = [&](const std::string&, const error&) { ++errors; };

    auto coordinator = build();
    auto source = make_source("f.bin", 4 * chunk_size);
    auto id = coordinator.submit(source, "dest", options);
    ASSERT_TRUE(id.has_value());

    entered_future.wait();
    ASSERT_TRUE(coordinator.pause(id.value()).has_value());
    release.set_value();

    auto done = coordinator.wait_for(id.value());
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::error);
    EXPECT_EQ(errors.load(), 1);

    auto paused = coordinator.pause(id.value());
    ASSERT_FALSE(paused.has_value());
    EXPECT_EQ(paused.error().code, error_code::invalid_state);

    auto resumed = coordinator.resume(id.value(), source, fast_options());
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::invalid_state);

    auto progress = coordinator.get_progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, upload_status::error);
    EXPECT_EQ(backend_->total_attempts(), 0);
    EXPECT_EQ(backend_->finalize_calls(), 0);
}

TEST_F(UploadCoordinatorTest, RetryFinalizeAfterFinalizeFailure) {
    std::atomic<int> finalize_attempts{0};
    std::atomic<int> errors{0};

    auto coordinator = build();
    backend_->set_finalize_hook([&](const std::string& session_id) -> result<finalize_result> {
        if (finalize_attempts++ == 0) {
            return unexpected(error{error_code::http_error, "HTTP 502"});
        }
        return finalize_result{"doc-" + session_id, "{}"};
    });

    auto options = fast_options();
    options.on_error = [&](const std::string&, const error& err) {
        EXPECT_EQ(err.code, error_code::finalize_failed);
        ++errors;
    };

    auto id = coordinator.submit(make_source("j.bin", 3 * chunk_size), "dest", options);
    ASSERT_TRUE(id.has_value());

    auto failed = coordinator.wait_for(id.value());
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed.value().status, upload_status::error);
    ASSERT_TRUE(failed.value().error_message.has_value());
    EXPECT_EQ(*failed.value().error_message, "failed to finalize upload: HTTP 502");
    EXPECT_EQ(errors.load(), 1);

    ASSERT_TRUE(coordinator.retry_finalize(id.value()).has_value());
    auto done = coordinator.wait_for(id.value());

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::completed);
    EXPECT_EQ(finalize_attempts.load(), 2);
    EXPECT_EQ(backend_->total_attempts(), 3);

    auto again = coordinator.retry_finalize(id.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(UploadCoordinatorTest, AggregateAndListing) {
    auto coordinator = build();

    auto first = coordinator.submit(make_source("k1.bin", 3000), "dest", fast_options());
    auto second = coordinator.submit(make_source("k2.bin", 1000), "dest", fast_options());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(coordinator.wait_for(first.value()).has_value());
    ASSERT_TRUE(coordinator.wait_for(second.value()).has_value());

    auto aggregate =
        coordinator.get_aggregate_progress({first.value(), second.value(), "unknown"});

    EXPECT_EQ(aggregate.total_files, 2u);
    EXPECT_EQ(aggregate.completed_files, 2u);
    EXPECT_EQ(aggregate.total_bytes, 4000u);
    EXPECT_EQ(aggregate.uploaded_bytes, 4000u);
    EXPECT_DOUBLE_EQ(aggregate.overall_progress_percent, 100.0);

    EXPECT_EQ(coordinator.get_all_uploads().size(), 2u);
}

TEST_F(UploadCoordinatorTest, WaitForTimesOut) {
    std::promise<void> release;
    auto released = release.get_future().share();

    auto coordinator = build();
    backend_->set_chunk_hook([released](uint64_t, const cancellation_token&) -> result<void> {
        released.wait();
        return {};
    });

    auto id = coordinator.submit(make_source("l.bin", chunk_size), "dest", fast_options());
    ASSERT_TRUE(id.has_value());

    auto waited = coordinator.wait_for(id.value(), 20ms);
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::wait_timeout);

    release.set_value();
    auto done = coordinator.wait_for(id.value());
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::completed);
}

TEST_F(UploadCoordinatorTest, RemoveOnlyFinishedUploads) {
    auto coordinator = build();
    auto source = make_source("m.bin", 4 * chunk_size);

    auto options = fast_options();
    options.on_progress = [&](const upload_progress& p) {
        if (p.uploaded_chunks == 1) {
            EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
        }
    };

    auto id = coordinator.submit(source, "dest", options);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(coordinator.wait_for(id.value()).has_value());

    auto removed = coordinator.remove(id.value());
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, error_code::invalid_state);

    ASSERT_TRUE(coordinator.resume(id.value(), source, fast_options()).has_value());
    ASSERT_TRUE(coordinator.wait_for(id.value()).has_value());

    ASSERT_TRUE(coordinator.remove(id.value()).has_value());
    EXPECT_FALSE(coordinator.get_progress(id.value()).has_value());
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(UploadCoordinatorTest, PausedUploadSurvivesRestart) {
    auto source = make_source("n.bin", 8 * chunk_size);
    std::string id;
    {
        auto coordinator = build(true);
        auto options = fast_options();
        options.on_progress = [&](const upload_progress& p) {
            if (p.uploaded_chunks == 5) {
                EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
            }
        };

        auto submitted = coordinator.submit(source, "dest", options);
        ASSERT_TRUE(submitted.has_value());
        id = submitted.value();
        ASSERT_TRUE(coordinator.wait_for(id).has_value());
    }

    session_store store{session_store_config(state_dir_)};
    auto stored = store.load(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().uploaded_chunks.size(), 5u);
    EXPECT_EQ(stored.value().destination_id, "dest");

    auto coordinator = build(true);
    auto restored = coordinator.restore(id);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored.value().status, upload_status::paused);
    EXPECT_EQ(restored.value().uploaded_chunks, 5u);
    EXPECT_EQ(restored.value().uploaded_bytes, 5 * chunk_size);
    EXPECT_EQ(restored.value().start_bytes, 5 * chunk_size);

    auto twice = coordinator.restore(id);
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, error_code::invalid_state);

    ASSERT_TRUE(coordinator.resume(id, source, fast_options()).has_value());
    auto done = coordinator.wait_for(id);

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::completed);
    EXPECT_EQ(backend_->init_calls(), 1);
    EXPECT_EQ(backend_->query_calls(), 1);
    EXPECT_EQ(backend_->total_attempts(), 8);
    EXPECT_FALSE(std::filesystem::exists(store.state_file_path(id)));
}

TEST_F(UploadCoordinatorTest, RestoreRewindsToServerCount) {
    auto source = make_source("o.bin", 6 * chunk_size);
    std::string id;
    {
        auto coordinator = build(true);
        auto options = fast_options();
        options.on_progress = [&](const upload_progress& p) {
            if (p.uploaded_chunks == 4) {
                EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
            }
        };
        auto submitted = coordinator.submit(source, "dest", options);
        ASSERT_TRUE(submitted.has_value());
        id = submitted.value();
        ASSERT_TRUE(coordinator.wait_for(id).has_value());
    }

    backend_->set_received_chunks(2);

    auto coordinator = build(true);
    ASSERT_TRUE(coordinator.restore(id).has_value());
    ASSERT_TRUE(coordinator.resume(id, source, fast_options()).has_value());
    auto done = coordinator.wait_for(id);

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().status, upload_status::completed);
    EXPECT_EQ(backend_->attempts(1), 1);
    EXPECT_EQ(backend_->attempts(2), 2);
    EXPECT_EQ(backend_->attempts(3), 2);
    EXPECT_EQ(backend_->attempts(4), 1);
}

TEST_F(UploadCoordinatorTest, RestoreAllPicksUpEveryStoredSession) {
    std::vector<std::string> ids;
    {
        auto coordinator = build(true);
        auto options = fast_options();
        options.on_progress = [&](const upload_progress& p) {
            if (p.uploaded_chunks == 1) {
                EXPECT_TRUE(coordinator.pause(p.file_id).has_value());
            }
        };
        for (const char* name : {"p1.bin", "p2.bin"}) {
            auto id = coordinator.submit(make_source(name, 3 * chunk_size), "dest", options);
            ASSERT_TRUE(id.has_value());
            ids.push_back(id.value());
        }
        for (const auto& id : ids) {
            ASSERT_TRUE(coordinator.wait_for(id).has_value());
        }
    }

    auto coordinator = build(true);
    auto restored = coordinator.restore_all();

    ASSERT_TRUE(restored.has_value());
    std::sort(restored.value().begin(), restored.value().end());
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(restored.value(), ids);

    for (const auto& upload : coordinator.get_all_uploads()) {
        EXPECT_EQ(upload.status, upload_status::paused);
    }

    auto none = coordinator.restore_all();
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(UploadCoordinatorTest, RestoreRequiresStateDirectory) {
    auto coordinator = build();

    auto restored = coordinator.restore("anything");
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, error_code::invalid_configuration);
}

TEST_F(UploadCoordinatorTest, DestroyingCoordinatorPausesRunningUploads) {
    backend_->set_chunk_hook([](uint64_t, const cancellation_token&) -> result<void> {
        std::this_thread::sleep_for(5ms);
        return {};
    });

    std::string id;
    {
        auto coordinator = build(true);
        auto submitted =
            coordinator.submit(make_source("q.bin", 200 * chunk_size), "dest", fast_options());
        ASSERT_TRUE(submitted.has_value());
        id = submitted.value();

        while (backend_->accepted_chunks().size() < 3) {
            std::this_thread::sleep_for(1ms);
        }
    }

    EXPECT_EQ(backend_->finalize_calls(), 0);

    session_store store{session_store_config(state_dir_)};
    auto stored = store.load(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_GE(stored.value().uploaded_chunks.size(), 3u);
    EXPECT_LT(stored.value().uploaded_chunks.size(), 200u);
    EXPECT_EQ(stored.value().uploaded_chunks.size(), backend_->accepted_chunks().size());
}

}  // namespace kcenon::chunked_upload::test
