#pragma once

#include "adapters/platform_adapter.h"
#include <optional>
#include <string>

namespace mcpaudit {

// Codex CLI writes turn-based JSONL to ~/.codex/sessions/YYYY/MM/DD/*.jsonl.
// Tokens always arrive through token_count events; function calls carry none.
class CodexCliAdapter : public IPlatformAdapter {
public:
    CodexCliAdapter() = default;

    Platform platform() const override { return Platform::CodexCli; }
    std::string name() const override { return "codex-cli"; }
    SourceKind source_kind() const override { return SourceKind::AppendOnlyLog; }

    ParseResult parse(const nlohmann::json& record) override;
    nlohmann::json platform_metadata() const override;

    std::string model() const override { return model_; }
    std::string working_directory() const override { return cwd_; }

    std::filesystem::path default_root() const override;
    std::vector<std::filesystem::path> find_session_files(const std::filesystem::path& root) const override;

    const std::string& cli_version() const { return cli_version_; }

private:
    void parse_session_meta(const nlohmann::json& payload);
    void parse_turn_context(const nlohmann::json& payload);
    std::optional<SessionTokenDelta> parse_token_count(const nlohmann::json& payload) const;
    std::optional<ToolCallEvent> parse_function_call(const nlohmann::json& payload) const;

    std::string model_;
    std::string cwd_;
    std::string cli_version_;
    nlohmann::json git_info_;
};

}
