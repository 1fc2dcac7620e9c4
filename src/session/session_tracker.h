#pragma once

#include "adapters/platform_adapter.h"
#include "metrics/session_aggregate.h"
#include "tailing/tail_cursor.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpaudit {

struct PollReport {
    size_t records = 0;          // raw records handed to the adapter
    size_t events_applied = 0;
    size_t unavailable_sources = 0;
    size_t diagnostics = 0;
    bool changed = false;        // aggregate or its context changed
};

// Drives one adapter over its session sources and feeds the single
// SessionAggregate. Not thread-safe: exactly one thread polls.
class SessionTracker {
public:
    static constexpr size_t kMaxKeptDiagnostics = 100;

    SessionTracker(std::unique_ptr<IPlatformAdapter> adapter, std::string project,
                   size_t call_history_limit = SessionAggregate::kDefaultCallHistoryLimit);

    void add_source(const std::filesystem::path& path);

    // Adds the newest session file under root. Returns false when none exists.
    bool add_latest_source(const std::filesystem::path& root);

    PollReport poll();

    // Polls until stop is set, sleeping interval between polls. on_change
    // runs after every poll that changed the aggregate.
    void monitor(const std::atomic<bool>& stop, std::chrono::milliseconds interval,
                 const std::function<void(const PollReport&)>& on_change = {});

    // Reads every source to its current end, taking start and end times from
    // the records rather than the wall clock.
    PollReport run_batch();

    SessionAggregate& aggregate() { return aggregate_; }
    const SessionAggregate& aggregate() const { return aggregate_; }
    const IPlatformAdapter& adapter() const { return *adapter_; }

    size_t source_count() const { return sources_.size(); }
    std::optional<Timestamp> first_event_time() const { return first_event_; }
    std::optional<Timestamp> last_event_time() const { return last_event_; }

    size_t diagnostic_count() const { return diagnostic_count_; }
    const std::vector<Diagnostic>& recent_diagnostics() const { return diagnostics_; }

private:
    struct Source {
        std::filesystem::path path;
        LineCursor lines;
        MessageCursor messages;
        bool unavailable = false;
    };

    size_t apply_records(const std::vector<nlohmann::json>& records);
    void note_event_time(const std::optional<Timestamp>& ts);
    void record_diagnostics(const std::vector<Diagnostic>& diagnostics);
    void refresh_context();

    std::unique_ptr<IPlatformAdapter> adapter_;
    SessionAggregate aggregate_;
    std::vector<Source> sources_;

    std::optional<Timestamp> first_event_;
    std::optional<Timestamp> last_event_;

    size_t diagnostic_count_ = 0;
    std::vector<Diagnostic> diagnostics_;
};

}
