#include "session/session_lifecycle.h"
#include "analytics/smells.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <time.h>

namespace mcpaudit {

SessionLifecycle::SessionLifecycle(SessionTracker& tracker, SessionStore& store)
    : tracker_(tracker)
    , store_(store)
{
}

void SessionLifecycle::request_stop(int signal_number) {
    int expected = 0;
    if (signal_number != 0) {
        stop_signal_.compare_exchange_strong(expected, signal_number);
    }
    stop_.store(true);
}

ShutdownResult SessionLifecycle::run(std::chrono::milliseconds interval) {
    const std::string platform = tracker_.aggregate().platform();

    tracker_.monitor(stop_, interval, [this](const PollReport&) {
        if (!store_.write_active(tracker_.aggregate().snapshot())) {
            std::cerr << "[mcpaudit] Could not update " << store_.active_path(tracker_.aggregate().platform()).string()
                      << std::endl;
        }
    });

    // StoreError leaves the active file in place.
    ShutdownResult result = shutdown(std::chrono::system_clock::now());
    if (result.outcome == ShutdownOutcome::Saved || result.outcome == ShutdownOutcome::Empty) {
        store_.remove_active(platform);
    }
    return result;
}

ShutdownResult SessionLifecycle::shutdown(Timestamp end_time) {
    if (result_.outcome != ShutdownOutcome::Pending) {
        return result_;
    }

    auto snapshot = tracker_.aggregate().finalize(end_time);
    if (!snapshot) {
        result_.outcome = ShutdownOutcome::Empty;
        std::cerr << "[mcpaudit] No data tracked - session not saved." << std::endl;
        return result_;
    }

    result_.snapshot = snapshot;
    result_.outcome = ShutdownOutcome::Failed;
    result_.saved_path = store_.save(*snapshot, detect_smells(*snapshot));
    result_.outcome = ShutdownOutcome::Saved;
    return result_;
}

SignalWatcher::SignalWatcher(Handler handler)
    : handler_(std::move(handler))
{
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    if (rc != 0) {
        fprintf(stderr, "Failed to block signals: %s\n", strerror(rc));
    }
    thread_ = std::thread(&SignalWatcher::run, this);
}

SignalWatcher::~SignalWatcher() {
    done_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::run() {
    timespec timeout{};
    timeout.tv_nsec = 200 * 1000 * 1000;

    while (!done_.load()) {
        int sig = sigtimedwait(&signals_, nullptr, &timeout);
        if (sig > 0) {
            if (handler_) {
                handler_(sig);
            }
            continue;
        }
        if (errno != EAGAIN && errno != EINTR) {
            fprintf(stderr, "Signal wait failed: %s\n", strerror(errno));
            return;
        }
    }
}

}
