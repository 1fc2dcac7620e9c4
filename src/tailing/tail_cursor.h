#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpaudit {

enum class PollStatus {
    Unchanged,    // source not modified since the last poll
    Updated,      // source re-read, records may be empty
    Unavailable,  // missing or unreadable; retried on the next poll
};

enum class DiagnosticKind {
    ParseError,
    ReadError,
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::ParseError;
    std::string source;
    size_t line = 0;  // 1-based, 0 when not line oriented
    std::string message;
};

struct LinePollResult {
    PollStatus status = PollStatus::Unchanged;
    std::vector<nlohmann::json> records;
    std::vector<Diagnostic> diagnostics;
};

// Cursor over an append-only JSONL source. Each line is handed out at most
// once no matter how often the source is polled.
class LineCursor {
public:
    LinePollResult poll(const std::filesystem::path& path);

    size_t consumed_lines() const { return consumed_; }

private:
    std::optional<std::filesystem::file_time_type> last_mtime_;
    size_t consumed_ = 0;
};

struct MessagePollResult {
    PollStatus status = PollStatus::Unchanged;
    nlohmann::json header = nlohmann::json::object();  // document without "messages"
    std::vector<nlohmann::json> messages;
    std::vector<Diagnostic> diagnostics;
};

// Cursor over a JSON document that is rewritten in full on every update.
// Messages are forwarded once per id.
class MessageCursor {
public:
    MessagePollResult poll(const std::filesystem::path& path);

    size_t seen_count() const { return seen_ids_.size(); }
    bool has_seen(const std::string& id) const { return seen_ids_.count(id) > 0; }

    static std::string message_id(const nlohmann::json& message, size_t index);

private:
    std::optional<std::filesystem::file_time_type> last_mtime_;
    std::set<std::string> seen_ids_;
};

}
