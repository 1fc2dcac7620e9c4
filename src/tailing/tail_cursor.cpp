#include "tailing/tail_cursor.h"
#include <fstream>
#include <iterator>

namespace mcpaudit {

namespace {

Diagnostic make_diagnostic(DiagnosticKind kind, const std::filesystem::path& path, size_t line, std::string message) {
    Diagnostic d;
    d.kind = kind;
    d.source = path.string();
    d.line = line;
    d.message = std::move(message);
    return d;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}

LinePollResult LineCursor::poll(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    LinePollResult result;

    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        result.status = PollStatus::Unavailable;
        result.diagnostics.push_back(make_diagnostic(DiagnosticKind::ReadError, path, 0, ec.message()));
        return result;
    }
    if (last_mtime_ && *last_mtime_ == mtime) {
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        result.status = PollStatus::Unavailable;
        result.diagnostics.push_back(make_diagnostic(DiagnosticKind::ReadError, path, 0, "cannot open file"));
        return result;
    }

    std::string line;
    size_t line_no = 0;
    while (line_no < consumed_ && std::getline(file, line)) {
        ++line_no;
    }

    size_t processed = 0;
    while (std::getline(file, line)) {
        bool terminated = !file.eof();
        if (is_blank(line)) {
            if (terminated) {
                ++processed;
            }
            continue;
        }

        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded()) {
            // A final line without newline may still be in the middle of
            // being written; leave it for the next poll.
            if (!terminated) {
                break;
            }
            result.diagnostics.push_back(make_diagnostic(
                DiagnosticKind::ParseError, path, consumed_ + processed + 1, "invalid JSON line"));
            ++processed;
            continue;
        }

        result.records.push_back(std::move(json));
        ++processed;
    }

    consumed_ += processed;
    last_mtime_ = mtime;
    result.status = PollStatus::Updated;
    return result;
}

std::string MessageCursor::message_id(const nlohmann::json& message, size_t index) {
    if (message.is_object() && message.contains("id")) {
        const auto& id = message["id"];
        if (id.is_string() && !id.get<std::string>().empty()) {
            return id.get<std::string>();
        }
        if (id.is_number()) {
            return id.dump();
        }
    }
    return "@" + std::to_string(index);
}

MessagePollResult MessageCursor::poll(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    MessagePollResult result;

    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        result.status = PollStatus::Unavailable;
        result.diagnostics.push_back(make_diagnostic(DiagnosticKind::ReadError, path, 0, ec.message()));
        return result;
    }
    if (last_mtime_ && *last_mtime_ == mtime) {
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        result.status = PollStatus::Unavailable;
        result.diagnostics.push_back(make_diagnostic(DiagnosticKind::ReadError, path, 0, "cannot open file"));
        return result;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        // Most likely caught mid-rewrite. The mtime is not recorded so the
        // next poll parses again.
        result.status = PollStatus::Updated;
        result.diagnostics.push_back(make_diagnostic(DiagnosticKind::ParseError, path, 0, "invalid session document"));
        return result;
    }

    last_mtime_ = mtime;
    result.status = PollStatus::Updated;

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() != "messages") {
            result.header[it.key()] = it.value();
        }
    }

    if (!doc.contains("messages") || !doc["messages"].is_array()) {
        return result;
    }

    const auto& messages = doc["messages"];
    for (size_t i = 0; i < messages.size(); ++i) {
        std::string id = message_id(messages[i], i);
        if (!seen_ids_.insert(id).second) {
            continue;
        }
        result.messages.push_back(messages[i]);
    }
    return result;
}

}
