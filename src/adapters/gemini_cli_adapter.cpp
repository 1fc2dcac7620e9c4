#include "adapters/gemini_cli_adapter.h"
#include "adapters/json_fields.h"
#include "core/time_utils.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <openssl/evp.h>

namespace mcpaudit {

namespace {

const std::map<std::string, std::string>& model_display_names() {
    static const std::map<std::string, std::string> names = {
        {"gemini-3-pro-preview", "Gemini 3 Pro Preview"},
        {"gemini-2.5-pro", "Gemini 2.5 Pro"},
        {"gemini-2.5-pro-preview", "Gemini 2.5 Pro Preview"},
        {"gemini-2.5-flash", "Gemini 2.5 Flash"},
        {"gemini-2.5-flash-preview", "Gemini 2.5 Flash Preview"},
        {"gemini-2.5-flash-lite", "Gemini 2.5 Flash Lite"},
        {"gemini-2.0-flash", "Gemini 2.0 Flash"},
        {"gemini-2.0-flash-lite", "Gemini 2.0 Flash Lite"},
    };
    return names;
}

// The session document uses camelCase; accept the snake_case spelling too.
const nlohmann::json* find_field(const nlohmann::json& obj, const char* camel, const char* snake) {
    if (!obj.is_object()) return nullptr;
    if (obj.contains(camel)) return &obj[camel];
    if (obj.contains(snake)) return &obj[snake];
    return nullptr;
}

std::optional<Timestamp> find_timestamp(const nlohmann::json& obj, const char* camel, const char* snake) {
    if (const auto* v = find_field(obj, camel, snake)) {
        return parse_timestamp_value(*v);
    }
    return std::nullopt;
}

}

GeminiSessionHeader GeminiSessionHeader::from_json(const nlohmann::json& doc) {
    GeminiSessionHeader header;
    if (const auto* v = find_field(doc, "sessionId", "session_id"); v && v->is_string()) {
        header.session_id = v->get<std::string>();
    }
    if (const auto* v = find_field(doc, "projectHash", "project_hash"); v && v->is_string()) {
        header.project_hash = v->get<std::string>();
    }
    header.start_time = find_timestamp(doc, "startTime", "start_time");
    header.last_updated = find_timestamp(doc, "lastUpdated", "last_updated");
    return header;
}

GeminiCliAdapter::GeminiCliAdapter() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        project_hash_ = project_hash_for(cwd);
    }
}

GeminiCliAdapter::GeminiCliAdapter(std::string project_hash)
    : project_hash_(std::move(project_hash))
{
}

void GeminiCliAdapter::set_document_header(const nlohmann::json& header) {
    header_ = GeminiSessionHeader::from_json(header);
}

bool GeminiCliAdapter::is_agent_message_type(const std::string& type) {
    return type == "gemini" || type == "agent" || type == "model";
}

ParseResult GeminiCliAdapter::parse(const nlohmann::json& message) {
    ParseResult result;
    if (!message.is_object()) {
        return result;
    }

    const std::string type = get_string(message, "type");
    if (!is_agent_message_type(type)) {
        return result;
    }
    result.counts_as_message = true;

    std::string msg_model = get_string(message, "model");
    if (model_.empty() && !msg_model.empty()) {
        model_ = msg_model;
    }

    std::optional<Timestamp> ts;
    if (message.contains("timestamp")) {
        ts = parse_timestamp_value(message["timestamp"]);
    }

    static const nlohmann::json empty = nlohmann::json::object();
    const auto& tokens = message.contains("tokens") && message["tokens"].is_object() ? message["tokens"] : empty;

    uint64_t thoughts = get_count(tokens, "thoughts");
    uint64_t tool_tokens = get_count(tokens, "tool");
    thoughts_tokens_ += thoughts;

    // Only the first MCP call of a message claims the message's tool tokens.
    if (const auto* calls = find_field(message, "toolCalls", "tool_calls"); calls && calls->is_array()) {
        for (const auto& call : *calls) {
            if (auto event = parse_tool_call(call, tool_tokens)) {
                event->timestamp = ts;
                result.events.emplace_back(std::move(*event));
                break;
            }
        }
    }

    SessionTokenDelta delta;
    delta.tokens.input_tokens = get_count(tokens, "input");
    delta.tokens.output_tokens = get_count(tokens, "output") + thoughts;
    delta.tokens.cache_created_tokens = 0;
    delta.tokens.cache_read_tokens = get_count(tokens, "cached");
    delta.timestamp = ts;
    if (delta.tokens.total() > 0) {
        result.events.emplace_back(delta);
    }

    return result;
}

std::optional<ToolCallEvent> GeminiCliAdapter::parse_tool_call(const nlohmann::json& call, uint64_t tool_tokens) const {
    const std::string tool_name = get_string(call, "name");
    if (!is_mcp_tool_name(tool_name)) {
        return std::nullopt;
    }

    nlohmann::json args = nlohmann::json::object();
    if (call.contains("args") && call["args"].is_object()) {
        args = call["args"];
    }

    ToolCallEvent event = make_tool_call_event(tool_name, args);
    event.tokens.output_tokens = tool_tokens;
    event.call_id = get_string(call, "id");
    if (call.contains("status") && call["status"].is_string()) {
        event.success = call["status"].get<std::string>() == "success";
    }
    return event;
}

nlohmann::json GeminiCliAdapter::platform_metadata() const {
    nlohmann::json meta = nlohmann::json::object();
    meta["model"] = model_.empty() ? nlohmann::json(nullptr) : nlohmann::json(model_);
    auto it = model_display_names().find(model_);
    meta["model_name"] = it != model_display_names().end() ? it->second
                       : (model_.empty() ? std::string("Unknown Model") : model_);
    meta["session_id"] = header_.session_id;
    meta["project_hash"] = header_.project_hash;
    meta["thoughts_tokens"] = thoughts_tokens_;
    return meta;
}

std::filesystem::path GeminiCliAdapter::default_root() const {
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::filesystem::path(home) / ".gemini";
}

std::vector<std::filesystem::path> GeminiCliAdapter::find_session_files(const std::filesystem::path& root) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path tmp_dir = root / "tmp";
    if (!fs::is_directory(tmp_dir, ec)) {
        return {};
    }

    fs::path chats_dir;
    if (!project_hash_.empty() && fs::is_directory(tmp_dir / project_hash_ / "chats", ec)) {
        chats_dir = tmp_dir / project_hash_ / "chats";
    } else {
        fs::file_time_type newest = fs::file_time_type::min();
        for (const auto& project : fs::directory_iterator(tmp_dir, ec)) {
            if (!project.is_directory() || project.path().filename().string().size() != 64) continue;
            fs::path chats = project.path() / "chats";
            std::error_code mtime_ec;
            auto mtime = fs::last_write_time(chats, mtime_ec);
            if (mtime_ec || !fs::is_directory(chats, mtime_ec)) continue;
            if (chats_dir.empty() || mtime > newest) {
                chats_dir = chats;
                newest = mtime;
            }
        }
    }
    if (chats_dir.empty()) {
        return {};
    }

    std::vector<std::pair<fs::path, fs::file_time_type>> found;
    for (const auto& entry : fs::directory_iterator(chats_dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string filename = entry.path().filename().string();
        if (filename.rfind("session-", 0) != 0 || entry.path().extension() != ".json") continue;
        std::error_code mtime_ec;
        auto mtime = fs::last_write_time(entry.path(), mtime_ec);
        if (mtime_ec) continue;
        found.emplace_back(entry.path(), mtime);
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

std::string GeminiCliAdapter::project_hash_for(const std::filesystem::path& project_dir) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(project_dir, ec);
    if (ec) {
        return {};
    }
    const std::string path = absolute.string();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(path.data(), path.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        std::cerr << "[Gemini CLI] Failed to hash " << path << std::endl;
        return {};
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hash;
    hash.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hash.push_back(kHex[digest[i] >> 4]);
        hash.push_back(kHex[digest[i] & 0x0F]);
    }
    return hash;
}

}
