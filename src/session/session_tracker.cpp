#include "session/session_tracker.h"
#include <iostream>
#include <thread>

namespace mcpaudit {

SessionTracker::SessionTracker(std::unique_ptr<IPlatformAdapter> adapter, std::string project,
                               size_t call_history_limit)
    : adapter_(std::move(adapter))
    , aggregate_(adapter_->name(), std::move(project), call_history_limit)
{
}

void SessionTracker::add_source(const std::filesystem::path& path) {
    for (const auto& source : sources_) {
        if (source.path == path) return;
    }
    Source source;
    source.path = path;
    sources_.push_back(std::move(source));
    aggregate_.add_source_file(path.filename().string());
}

bool SessionTracker::add_latest_source(const std::filesystem::path& root) {
    auto files = adapter_->find_session_files(root);
    if (files.empty()) {
        return false;
    }
    add_source(files.front());
    return true;
}

PollReport SessionTracker::poll() {
    PollReport report;
    const bool rewritten = adapter_->source_kind() == SourceKind::RewrittenDocument;

    for (auto& source : sources_) {
        PollStatus status;
        std::vector<nlohmann::json> records;
        std::vector<Diagnostic> diagnostics;

        if (rewritten) {
            auto result = source.messages.poll(source.path);
            status = result.status;
            if (status == PollStatus::Updated && !result.header.empty()) {
                adapter_->set_document_header(result.header);
            }
            records = std::move(result.messages);
            diagnostics = std::move(result.diagnostics);
        } else {
            auto result = source.lines.poll(source.path);
            status = result.status;
            records = std::move(result.records);
            diagnostics = std::move(result.diagnostics);
        }

        if (status == PollStatus::Unavailable) {
            report.unavailable_sources += 1;
            if (!source.unavailable) {
                std::string reason = diagnostics.empty() ? std::string("unreadable") : diagnostics.front().message;
                std::cerr << "[" << adapter_->name() << "] Waiting for " << source.path.string()
                          << ": " << reason << std::endl;
            }
            source.unavailable = true;
            continue;
        }
        source.unavailable = false;

        record_diagnostics(diagnostics);
        report.diagnostics += diagnostics.size();
        report.records += records.size();
        report.events_applied += apply_records(records);
    }

    if (report.records > 0) {
        refresh_context();
        report.changed = true;
    }
    return report;
}

void SessionTracker::monitor(const std::atomic<bool>& stop, std::chrono::milliseconds interval,
                             const std::function<void(const PollReport&)>& on_change) {
    while (!stop.load()) {
        PollReport report = poll();
        if (report.changed && on_change) {
            on_change(report);
        }
        if (stop.load()) {
            break;
        }
        std::this_thread::sleep_for(interval);
    }
}

PollReport SessionTracker::run_batch() {
    PollReport report = poll();

    std::optional<Timestamp> start = adapter_->session_start();
    if (!start) {
        start = first_event_;
    }
    if (start) {
        aggregate_.set_start_time(*start);
    }
    return report;
}

size_t SessionTracker::apply_records(const std::vector<nlohmann::json>& records) {
    size_t applied = 0;
    for (const auto& record : records) {
        ParseResult parsed = adapter_->parse(record);
        if (parsed.counts_as_message) {
            aggregate_.count_message();
        }
        for (const auto& event : parsed.events) {
            std::visit([this](const auto& e) { note_event_time(e.timestamp); }, event);
            if (aggregate_.apply(event)) {
                ++applied;
            }
        }
    }
    return applied;
}

void SessionTracker::note_event_time(const std::optional<Timestamp>& ts) {
    if (!ts) return;
    if (!first_event_ || *ts < *first_event_) first_event_ = *ts;
    if (!last_event_ || *ts > *last_event_) last_event_ = *ts;
}

void SessionTracker::record_diagnostics(const std::vector<Diagnostic>& diagnostics) {
    diagnostic_count_ += diagnostics.size();
    for (const auto& d : diagnostics) {
        if (diagnostics_.size() >= kMaxKeptDiagnostics) {
            diagnostics_.erase(diagnostics_.begin());
        }
        diagnostics_.push_back(d);
    }
}

void SessionTracker::refresh_context() {
    aggregate_.set_context(adapter_->model(), adapter_->working_directory());
    aggregate_.set_platform_data(adapter_->platform_metadata());
}

}
