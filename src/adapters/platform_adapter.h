#pragma once

#include "core/canonical_event.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpaudit {

enum class Platform {
    CodexCli,
    GeminiCli,
};

// How a platform writes its session source.
enum class SourceKind {
    AppendOnlyLog,      // one JSON object per line, only ever appended
    RewrittenDocument,  // one JSON document, rewritten wholesale on update
};

struct ParseResult {
    std::vector<CanonicalEvent> events;
    bool counts_as_message = false;
};

class IPlatformAdapter {
public:
    virtual ~IPlatformAdapter() = default;

    virtual Platform platform() const = 0;
    virtual std::string name() const = 0;
    virtual SourceKind source_kind() const = 0;

    // Translates one raw record. Records that carry nothing reportable
    // yield an empty result; adapter context (model, cwd) may still change.
    virtual ParseResult parse(const nlohmann::json& record) = 0;

    virtual nlohmann::json platform_metadata() const = 0;

    virtual std::string model() const = 0;
    virtual std::string working_directory() const { return {}; }

    // Document-level fields of a rewritten source, without its messages.
    virtual void set_document_header(const nlohmann::json& header) { (void)header; }

    // Start time announced by the source itself, if any.
    virtual std::optional<Timestamp> session_start() const { return std::nullopt; }

    // Default data directory of the CLI, e.g. ~/.codex
    virtual std::filesystem::path default_root() const = 0;

    // Session files under root, newest first.
    virtual std::vector<std::filesystem::path> find_session_files(const std::filesystem::path& root) const = 0;
};

const char* platform_name(Platform platform);
std::optional<Platform> parse_platform(const std::string& name);

}
