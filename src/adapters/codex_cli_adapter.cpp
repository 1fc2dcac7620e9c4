#include "adapters/codex_cli_adapter.h"
#include "adapters/json_fields.h"
#include "core/time_utils.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>

namespace mcpaudit {

namespace {

const std::map<std::string, std::string>& model_display_names() {
    static const std::map<std::string, std::string> names = {
        {"gpt-5.1-codex-max", "GPT-5.1 Codex Max"},
        {"gpt-5-codex", "GPT-5 Codex"},
        {"gpt-5.1", "GPT-5.1"},
        {"gpt-5-mini", "GPT-5 Mini"},
        {"gpt-5-nano", "GPT-5 Nano"},
        {"gpt-5-pro", "GPT-5 Pro"},
        {"gpt-4.1", "GPT-4.1"},
        {"gpt-4.1-mini", "GPT-4.1 Mini"},
        {"gpt-4.1-nano", "GPT-4.1 Nano"},
        {"o4-mini", "O4 Mini"},
        {"o3-mini", "O3 Mini"},
        {"o1-preview", "O1 Preview"},
        {"o1-mini", "O1 Mini"},
        {"gpt-4o", "GPT-4o"},
        {"gpt-4o-mini", "GPT-4o Mini"},
    };
    return names;
}

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

}

ParseResult CodexCliAdapter::parse(const nlohmann::json& record) {
    ParseResult result;
    if (!record.is_object()) {
        return result;
    }

    const std::string type = get_string(record, "type");
    static const nlohmann::json empty = nlohmann::json::object();
    const auto& payload = record.contains("payload") && record["payload"].is_object() ? record["payload"] : empty;

    std::optional<Timestamp> ts;
    if (record.contains("timestamp")) {
        ts = parse_timestamp_value(record["timestamp"]);
    }

    if (type == "session_meta") {
        parse_session_meta(payload);
        return result;
    }

    if (type == "turn_context") {
        parse_turn_context(payload);
        return result;
    }

    const std::string payload_type = get_string(payload, "type");

    if (type == "event_msg" && payload_type == "token_count") {
        if (auto delta = parse_token_count(payload)) {
            delta->timestamp = ts;
            result.events.emplace_back(std::move(*delta));
        }
        return result;
    }

    if (type == "response_item" && payload_type == "function_call") {
        if (auto call = parse_function_call(payload)) {
            call->timestamp = ts;
            result.events.emplace_back(std::move(*call));
        }
        return result;
    }

    return result;
}

void CodexCliAdapter::parse_session_meta(const nlohmann::json& payload) {
    std::string cwd = get_string(payload, "cwd");
    if (!cwd.empty()) {
        cwd_ = cwd;
    }
    cli_version_ = get_string(payload, "cli_version");
    if (payload.contains("git")) {
        git_info_ = payload["git"];
    }
}

void CodexCliAdapter::parse_turn_context(const nlohmann::json& payload) {
    if (!model_.empty()) {
        return;
    }
    model_ = get_string(payload, "model");
    if (cwd_.empty()) {
        cwd_ = get_string(payload, "cwd");
    }
}

std::optional<SessionTokenDelta> CodexCliAdapter::parse_token_count(const nlohmann::json& payload) const {
    if (!payload.contains("info") || !payload["info"].is_object()) {
        return std::nullopt;
    }
    const auto& info = payload["info"];

    // last_token_usage is the delta since the previous report; the
    // cumulative total is only a fallback for older logs.
    const nlohmann::json* usage = nullptr;
    if (info.contains("last_token_usage") && info["last_token_usage"].is_object() &&
        !info["last_token_usage"].empty()) {
        usage = &info["last_token_usage"];
    } else if (info.contains("total_token_usage") && info["total_token_usage"].is_object()) {
        usage = &info["total_token_usage"];
    }
    if (!usage) {
        return std::nullopt;
    }

    SessionTokenDelta delta;
    delta.tokens.input_tokens = get_count(*usage, "input_tokens");
    delta.tokens.output_tokens = get_count(*usage, "output_tokens") + get_count(*usage, "reasoning_output_tokens");
    delta.tokens.cache_created_tokens = 0;
    delta.tokens.cache_read_tokens = get_count(*usage, "cached_input_tokens");

    if (delta.tokens.total() == 0) {
        return std::nullopt;
    }
    return delta;
}

std::optional<ToolCallEvent> CodexCliAdapter::parse_function_call(const nlohmann::json& payload) const {
    const std::string tool_name = get_string(payload, "name");
    if (!is_mcp_tool_name(tool_name)) {
        return std::nullopt;
    }

    nlohmann::json params = nlohmann::json::object();
    if (payload.contains("arguments")) {
        const auto& args = payload["arguments"];
        if (args.is_string()) {
            auto decoded = nlohmann::json::parse(args.get<std::string>(), nullptr, false);
            if (!decoded.is_discarded()) {
                params = std::move(decoded);
            }
        } else if (args.is_object()) {
            params = args;
        }
    }

    ToolCallEvent call = make_tool_call_event(tool_name, params);
    call.call_id = get_string(payload, "call_id");
    return call;
}

nlohmann::json CodexCliAdapter::platform_metadata() const {
    nlohmann::json meta = nlohmann::json::object();
    meta["model"] = model_.empty() ? nlohmann::json(nullptr) : nlohmann::json(model_);
    auto it = model_display_names().find(model_);
    meta["model_name"] = it != model_display_names().end() ? it->second
                       : (model_.empty() ? std::string("Unknown Model") : model_);
    meta["cli_version"] = cli_version_.empty() ? nlohmann::json(nullptr) : nlohmann::json(cli_version_);
    meta["session_cwd"] = cwd_.empty() ? nlohmann::json(nullptr) : nlohmann::json(cwd_);
    meta["git_info"] = git_info_;
    return meta;
}

std::filesystem::path CodexCliAdapter::default_root() const {
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::filesystem::path(home) / ".codex";
}

std::vector<std::filesystem::path> CodexCliAdapter::find_session_files(const std::filesystem::path& root) const {
    namespace fs = std::filesystem;

    std::vector<std::pair<fs::path, fs::file_time_type>> found;
    std::error_code ec;
    fs::path sessions_dir = root / "sessions";
    if (!fs::is_directory(sessions_dir, ec)) {
        return {};
    }

    for (const auto& year : fs::directory_iterator(sessions_dir, ec)) {
        if (!year.is_directory() || !is_digits(year.path().filename().string())) continue;
        for (const auto& month : fs::directory_iterator(year.path(), ec)) {
            if (!month.is_directory() || !is_digits(month.path().filename().string())) continue;
            for (const auto& day : fs::directory_iterator(month.path(), ec)) {
                if (!day.is_directory() || !is_digits(day.path().filename().string())) continue;
                for (const auto& entry : fs::directory_iterator(day.path(), ec)) {
                    if (!entry.is_regular_file() || entry.path().extension() != ".jsonl") continue;
                    std::error_code mtime_ec;
                    auto mtime = fs::last_write_time(entry.path(), mtime_ec);
                    if (mtime_ec) continue;
                    found.emplace_back(entry.path(), mtime);
                }
            }
        }
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    std::vector<fs::path> result;
    result.reserve(found.size());
    for (auto& [path, mtime] : found) {
        result.push_back(std::move(path));
    }
    return result;
}

}
