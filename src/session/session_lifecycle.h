#pragma once

#include "session/session_tracker.h"
#include "storage/session_store.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <thread>
#include <signal.h>

namespace mcpaudit {

enum class ShutdownOutcome {
    Pending,
    Saved,
    Empty,   // nothing tracked, nothing written
    Failed,  // storage error, already reported to the first caller
};

struct ShutdownResult {
    ShutdownOutcome outcome = ShutdownOutcome::Pending;
    std::optional<std::filesystem::path> saved_path;
    std::optional<SessionSnapshot> snapshot;
};

// Owns the end of a tracking session: stop requests, the live snapshot file,
// and the single finalize-and-persist step.
class SessionLifecycle {
public:
    SessionLifecycle(SessionTracker& tracker, SessionStore& store);

    // Safe to call from any thread, any number of times.
    void request_stop(int signal_number = 0);
    bool stop_requested() const { return stop_.load(); }
    int stop_signal() const { return stop_signal_.load(); }
    const std::atomic<bool>& stop_flag() const { return stop_; }

    // Monitors until a stop is requested, keeping the active snapshot
    // current, then shuts down. The active snapshot is removed only once the
    // session is saved or found empty.
    ShutdownResult run(std::chrono::milliseconds interval);

    // Finalizes and persists exactly once. Later calls return the first
    // result. Throws StoreError from the first call if the session cannot
    // be written.
    ShutdownResult shutdown(Timestamp end_time);

    bool is_shut_down() const { return result_.outcome != ShutdownOutcome::Pending; }

private:
    SessionTracker& tracker_;
    SessionStore& store_;
    std::atomic<bool> stop_{false};
    std::atomic<int> stop_signal_{0};
    ShutdownResult result_;
};

// Blocks SIGINT and SIGTERM in the constructing thread and waits for them on
// a dedicated thread, handing each one to the handler. Construct before any
// other thread is started so they inherit the mask.
class SignalWatcher {
public:
    using Handler = std::function<void(int)>;

    explicit SignalWatcher(Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run();

    Handler handler_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

}
