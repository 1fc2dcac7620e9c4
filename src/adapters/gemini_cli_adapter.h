#pragma once

#include "adapters/platform_adapter.h"
#include <filesystem>
#include <optional>
#include <string>

namespace mcpaudit {

// Header fields of a Gemini CLI session document.
struct GeminiSessionHeader {
    std::string session_id;
    std::string project_hash;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> last_updated;

    static GeminiSessionHeader from_json(const nlohmann::json& doc);
};

// Gemini CLI rewrites ~/.gemini/tmp/<project_hash>/chats/session-*.json on
// every update. Each record handed to parse() is one message object.
// Session discovery looks in the configured project's directory and falls
// back to the project whose chats changed most recently.
class GeminiCliAdapter : public IPlatformAdapter {
public:
    // Prefers the chats of the current working directory's project.
    GeminiCliAdapter();
    explicit GeminiCliAdapter(std::string project_hash);

    Platform platform() const override { return Platform::GeminiCli; }
    std::string name() const override { return "gemini-cli"; }
    SourceKind source_kind() const override { return SourceKind::RewrittenDocument; }

    ParseResult parse(const nlohmann::json& message) override;
    nlohmann::json platform_metadata() const override;

    std::string model() const override { return model_; }

    void set_document_header(const nlohmann::json& header) override;
    std::optional<Timestamp> session_start() const override { return header_.start_time; }

    std::filesystem::path default_root() const override;
    std::vector<std::filesystem::path> find_session_files(const std::filesystem::path& root) const override;

    void set_header(const GeminiSessionHeader& header) { header_ = header; }
    const std::string& project_hash() const { return project_hash_; }

    // Gemini CLI names a project directory after the SHA-256 of its absolute
    // path, as 64 lowercase hex digits. Empty if hashing fails.
    static std::string project_hash_for(const std::filesystem::path& project_dir);
    const GeminiSessionHeader& header() const { return header_; }

    // Thinking tokens seen so far. Informational only: they are already
    // folded into the output bucket of the canonical totals.
    uint64_t thoughts_tokens() const { return thoughts_tokens_; }

    static bool is_agent_message_type(const std::string& type);

private:
    std::optional<ToolCallEvent> parse_tool_call(const nlohmann::json& call, uint64_t tool_tokens) const;

    std::string project_hash_;
    std::string model_;
    uint64_t thoughts_tokens_ = 0;
    GeminiSessionHeader header_;
};

}
