#include <gtest/gtest.h>
#include "adapters/adapter_factory.h"
#include "core/time_utils.h"
#include "session/session_lifecycle.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace mcpaudit;

class SessionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "mcpaudit_lifecycle_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        ASSERT_TRUE(parse_iso8601_utc("2025-11-04T12:00:00Z", end_));
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_codex_log() {
        fs::path path = test_dir_ / "rollout.jsonl";
        std::ofstream file(path);
        file << R"({"timestamp": "2025-11-04T11:38:25.000Z", "type": "event_msg", "payload": {"type": "token_count", "info": {"last_token_usage": {"input_tokens": 300, "output_tokens": 200}}}})" "\n";
        file << R"({"timestamp": "2025-11-04T11:38:30.000Z", "type": "response_item", "payload": {"type": "function_call", "name": "mcp__zen__chat", "arguments": "{}", "call_id": "call_1"}})" "\n";
        return path;
    }

    size_t count_saved(const SessionStore& store) {
        return store.list_sessions().size();
    }

    fs::path test_dir_;
    Timestamp end_;
};

TEST_F(SessionLifecycleTest, EmptySessionNotSaved) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    SessionStore store(test_dir_ / "sessions");
    SessionLifecycle lifecycle(tracker, store);

    auto result = lifecycle.shutdown(end_);
    EXPECT_EQ(result.outcome, ShutdownOutcome::Empty);
    EXPECT_FALSE(result.saved_path.has_value());
    EXPECT_EQ(count_saved(store), 0u);
}

TEST_F(SessionLifecycleTest, ShutdownSavesExactlyOnce) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    tracker.add_source(write_codex_log());
    tracker.run_batch();

    SessionStore store(test_dir_ / "sessions");
    SessionLifecycle lifecycle(tracker, store);

    auto first = lifecycle.shutdown(end_);
    ASSERT_EQ(first.outcome, ShutdownOutcome::Saved);
    ASSERT_TRUE(first.saved_path.has_value());
    EXPECT_TRUE(lifecycle.is_shut_down());

    auto second = lifecycle.shutdown(end_ + std::chrono::minutes(1));
    EXPECT_EQ(second.outcome, ShutdownOutcome::Saved);
    EXPECT_EQ(*second.saved_path, *first.saved_path);
    EXPECT_EQ(count_saved(store), 1u);

    auto stored = SessionStore::load(*first.saved_path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->snapshot.token_usage.total_tokens, 500u);
    EXPECT_EQ(stored->snapshot.server_sessions.at("zen").total_calls, 1u);
    ASSERT_TRUE(stored->snapshot.end_time.has_value());
    EXPECT_EQ(format_iso8601_utc(*stored->snapshot.end_time).substr(0, 19), "2025-11-04T12:00:00");
}

TEST_F(SessionLifecycleTest, StoreFailurePropagatesOnce) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    tracker.add_source(write_codex_log());
    tracker.run_batch();

    std::ofstream(test_dir_ / "blocker") << "x";
    SessionStore store(test_dir_ / "blocker");
    SessionLifecycle lifecycle(tracker, store);

    EXPECT_THROW(lifecycle.shutdown(end_), StoreError);
    auto again = lifecycle.shutdown(end_);
    EXPECT_EQ(again.outcome, ShutdownOutcome::Failed);
}

TEST_F(SessionLifecycleTest, FirstSignalWins) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    SessionStore store(test_dir_ / "sessions");
    SessionLifecycle lifecycle(tracker, store);

    EXPECT_FALSE(lifecycle.stop_requested());
    lifecycle.request_stop(SIGTERM);
    lifecycle.request_stop(SIGINT);
    EXPECT_TRUE(lifecycle.stop_requested());
    EXPECT_EQ(lifecycle.stop_signal(), SIGTERM);
}

TEST_F(SessionLifecycleTest, RunAfterStopStillSaves) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    tracker.add_source(write_codex_log());
    tracker.poll();

    SessionStore store(test_dir_ / "sessions");
    SessionLifecycle lifecycle(tracker, store);
    lifecycle.request_stop();

    auto result = lifecycle.run(std::chrono::milliseconds(10));
    EXPECT_EQ(result.outcome, ShutdownOutcome::Saved);
    EXPECT_FALSE(fs::exists(store.active_path("codex-cli")));
    EXPECT_EQ(count_saved(store), 1u);
}

TEST_F(SessionLifecycleTest, FailedSaveKeepsActiveSnapshot) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    tracker.add_source(write_codex_log());

    fs::path root = test_dir_ / "sessions";
    fs::create_directories(root);
    std::string day = format_iso8601_utc(tracker.aggregate().start_time()).substr(0, 10);
    std::ofstream(root / day) << "blocks the day directory";

    SessionStore store(root);
    SessionLifecycle lifecycle(tracker, store);
    fs::path active = store.active_path("codex-cli");

    std::thread stopper([&] {
        for (int i = 0; i < 500 && !fs::exists(active); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        lifecycle.request_stop();
    });
    EXPECT_THROW(lifecycle.run(std::chrono::milliseconds(10)), StoreError);
    stopper.join();

    EXPECT_TRUE(fs::exists(active));
    auto stored = SessionStore::load(active);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->snapshot.token_usage.total_tokens, 500u);
}

TEST_F(SessionLifecycleTest, EmptyRunRemovesActiveSnapshot) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    SessionStore store(test_dir_ / "sessions");
    fs::create_directories(store.active_path("codex-cli").parent_path());
    std::ofstream(store.active_path("codex-cli")) << "{}";

    SessionLifecycle lifecycle(tracker, store);
    lifecycle.request_stop();
    EXPECT_EQ(lifecycle.run(std::chrono::milliseconds(10)).outcome, ShutdownOutcome::Empty);
    EXPECT_FALSE(fs::exists(store.active_path("codex-cli")));
}

TEST_F(SessionLifecycleTest, TerminationSignalStopsAndSaves) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    tracker.add_source(write_codex_log());

    SessionStore store(test_dir_ / "sessions");
    SessionLifecycle lifecycle(tracker, store);

    ShutdownResult result;
    {
        SignalWatcher watcher([&lifecycle](int sig) { lifecycle.request_stop(sig); });
        ASSERT_EQ(kill(getpid(), SIGTERM), 0);
        result = lifecycle.run(std::chrono::milliseconds(10));
    }

    EXPECT_TRUE(lifecycle.stop_requested());
    EXPECT_EQ(lifecycle.stop_signal(), SIGTERM);
    EXPECT_EQ(result.outcome, ShutdownOutcome::Saved);
    EXPECT_EQ(count_saved(store), 1u);
}

TEST_F(SessionLifecycleTest, SignalDuringBatchStillSaves) {
    SessionTracker tracker(create_adapter(Platform::CodexCli), "demo");
    tracker.add_source(write_codex_log());

    SessionStore store(test_dir_ / "sessions");
    SessionLifecycle lifecycle(tracker, store);

    ShutdownResult result;
    {
        SignalWatcher watcher([&lifecycle](int sig) { lifecycle.request_stop(sig); });
        ASSERT_EQ(kill(getpid(), SIGINT), 0);
        tracker.run_batch();
        for (int i = 0; i < 500 && !lifecycle.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        result = lifecycle.shutdown(tracker.last_event_time().value_or(end_));
    }

    EXPECT_EQ(lifecycle.stop_signal(), SIGINT);
    EXPECT_EQ(result.outcome, ShutdownOutcome::Saved);
    EXPECT_EQ(count_saved(store), 1u);
}
