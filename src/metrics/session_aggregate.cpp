#include "metrics/session_aggregate.h"
#include "core/time_utils.h"
#include <algorithm>

namespace mcpaudit {

namespace {

nlohmann::json optional_timestamp_json(const std::optional<Timestamp>& ts) {
    if (!ts) return nullptr;
    return format_iso8601_utc(*ts);
}

std::optional<Timestamp> optional_timestamp_from(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    return parse_timestamp_value(j[key]);
}

uint64_t get_u64(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return 0;
    if (j[key].is_number_float()) {
        double v = j[key].get<double>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (j[key].is_number_unsigned()) return j[key].get<uint64_t>();
    int64_t v = j[key].get<int64_t>();
    return v > 0 ? static_cast<uint64_t>(v) : 0;
}

}

void TokenTotals::add(const TokenCounts& delta) {
    input_tokens += delta.input_tokens;
    output_tokens += delta.output_tokens;
    cache_created_tokens += delta.cache_created_tokens;
    cache_read_tokens += delta.cache_read_tokens;
    recompute();
}

void TokenTotals::recompute() {
    total_tokens = input_tokens + output_tokens + cache_created_tokens + cache_read_tokens;
    uint64_t input_side = input_tokens + cache_created_tokens + cache_read_tokens;
    cache_efficiency = input_side > 0
        ? static_cast<double>(cache_read_tokens) / static_cast<double>(input_side)
        : 0.0;
}

void to_json(nlohmann::json& j, const TokenTotals& t) {
    j = nlohmann::json{
        {"input_tokens", t.input_tokens},
        {"output_tokens", t.output_tokens},
        {"cache_created_tokens", t.cache_created_tokens},
        {"cache_read_tokens", t.cache_read_tokens},
        {"total_tokens", t.total_tokens},
        {"cache_efficiency", t.cache_efficiency},
    };
}

void from_json(const nlohmann::json& j, TokenTotals& t) {
    t.input_tokens = get_u64(j, "input_tokens");
    t.output_tokens = get_u64(j, "output_tokens");
    t.cache_created_tokens = get_u64(j, "cache_created_tokens");
    t.cache_read_tokens = get_u64(j, "cache_read_tokens");
    // Never trust stored totals.
    t.recompute();
}

void to_json(nlohmann::json& j, const CallRecord& r) {
    j = nlohmann::json{
        {"timestamp", optional_timestamp_json(r.timestamp)},
        {"total_tokens", r.total_tokens},
        {"input_tokens", r.input_tokens},
        {"output_tokens", r.output_tokens},
        {"cache_created_tokens", r.cache_created_tokens},
        {"cache_read_tokens", r.cache_read_tokens},
    };
    if (r.duration_ms) j["duration_ms"] = *r.duration_ms;
    if (r.success) j["success"] = *r.success;
    if (!r.call_id.empty()) j["call_id"] = r.call_id;
    if (r.content_signature) j["content_signature"] = *r.content_signature;
}

void from_json(const nlohmann::json& j, CallRecord& r) {
    r.timestamp = optional_timestamp_from(j, "timestamp");
    r.total_tokens = get_u64(j, "total_tokens");
    r.input_tokens = get_u64(j, "input_tokens");
    r.output_tokens = get_u64(j, "output_tokens");
    r.cache_created_tokens = get_u64(j, "cache_created_tokens");
    r.cache_read_tokens = get_u64(j, "cache_read_tokens");
    if (j.contains("duration_ms") && j["duration_ms"].is_number()) {
        r.duration_ms = get_u64(j, "duration_ms");
    }
    if (j.contains("success") && j["success"].is_boolean()) {
        r.success = j["success"].get<bool>();
    }
    if (j.contains("call_id") && j["call_id"].is_string()) {
        r.call_id = j["call_id"].get<std::string>();
    }
    if (j.contains("content_signature") && j["content_signature"].is_string()) {
        r.content_signature = j["content_signature"].get<std::string>();
    }
}

void to_json(nlohmann::json& j, const SessionSnapshot& s) {
    nlohmann::json servers = nlohmann::json::object();
    for (const auto& [server_name, server] : s.server_sessions) {
        nlohmann::json tools = nlohmann::json::object();
        for (const auto& [tool_name, stats] : server.tools) {
            tools[tool_name] = {
                {"calls", stats.calls},
                {"total_tokens", stats.total_tokens},
                {"avg_tokens", stats.avg_tokens},
                {"call_history", stats.call_history},
            };
        }
        servers[server_name] = {
            {"total_calls", server.total_calls},
            {"total_tokens", server.total_tokens},
            {"tools", std::move(tools)},
        };
    }

    j = nlohmann::json{
        {"session", {
            {"platform", s.platform},
            {"project", s.project},
            {"model", s.model},
            {"working_directory", s.working_directory},
            {"start_time", format_iso8601_utc(s.start_time)},
            {"end_time", optional_timestamp_json(s.end_time)},
            {"duration_seconds", s.duration_seconds},
            {"message_count", s.message_count},
            {"source_files", s.source_files},
        }},
        {"token_usage", s.token_usage},
        {"mcp_summary", {
            {"total_calls", s.mcp_summary.total_calls},
            {"unique_tools", s.mcp_summary.unique_tools},
            {"total_tokens", s.mcp_summary.total_tokens},
        }},
        {"server_sessions", std::move(servers)},
        {"platform_data", s.platform_data},
    };
}

void from_json(const nlohmann::json& j, SessionSnapshot& s) {
    s = SessionSnapshot{};

    if (j.contains("session") && j["session"].is_object()) {
        const auto& session = j["session"];
        s.platform = session.value("platform", "");
        s.project = session.value("project", "");
        if (session.contains("model") && session["model"].is_string()) {
            s.model = session["model"].get<std::string>();
        }
        s.working_directory = session.value("working_directory", "");
        if (auto start = optional_timestamp_from(session, "start_time")) {
            s.start_time = *start;
        }
        s.end_time = optional_timestamp_from(session, "end_time");
        if (session.contains("duration_seconds") && session["duration_seconds"].is_number()) {
            s.duration_seconds = session["duration_seconds"].get<double>();
        }
        s.message_count = get_u64(session, "message_count");
        if (session.contains("source_files") && session["source_files"].is_array()) {
            for (const auto& f : session["source_files"]) {
                if (f.is_string()) s.source_files.push_back(f.get<std::string>());
            }
        }
    }

    if (j.contains("token_usage") && j["token_usage"].is_object()) {
        s.token_usage = j["token_usage"].get<TokenTotals>();
    }

    if (j.contains("mcp_summary") && j["mcp_summary"].is_object()) {
        const auto& summary = j["mcp_summary"];
        s.mcp_summary.total_calls = get_u64(summary, "total_calls");
        s.mcp_summary.unique_tools = get_u64(summary, "unique_tools");
        s.mcp_summary.total_tokens = get_u64(summary, "total_tokens");
    }

    if (j.contains("server_sessions") && j["server_sessions"].is_object()) {
        for (auto it = j["server_sessions"].begin(); it != j["server_sessions"].end(); ++it) {
            if (!it.value().is_object()) continue;
            ServerSession server;
            server.total_calls = get_u64(it.value(), "total_calls");
            server.total_tokens = get_u64(it.value(), "total_tokens");
            if (it.value().contains("tools") && it.value()["tools"].is_object()) {
                const auto& tools = it.value()["tools"];
                for (auto t = tools.begin(); t != tools.end(); ++t) {
                    if (!t.value().is_object()) continue;
                    ToolStats stats;
                    stats.calls = get_u64(t.value(), "calls");
                    stats.total_tokens = get_u64(t.value(), "total_tokens");
                    stats.avg_tokens = stats.calls > 0
                        ? static_cast<double>(stats.total_tokens) / static_cast<double>(stats.calls)
                        : 0.0;
                    if (t.value().contains("call_history") && t.value()["call_history"].is_array()) {
                        for (const auto& record : t.value()["call_history"]) {
                            if (record.is_object()) {
                                stats.call_history.push_back(record.get<CallRecord>());
                            }
                        }
                    }
                    server.tools[t.key()] = std::move(stats);
                }
            }
            s.server_sessions[it.key()] = std::move(server);
        }
    }

    if (j.contains("platform_data") && j["platform_data"].is_object()) {
        s.platform_data = j["platform_data"];
    }
}

const ToolStats* SessionSnapshot::find_tool(const std::string& server, const std::string& tool) const {
    auto s = server_sessions.find(server);
    if (s == server_sessions.end()) return nullptr;
    auto t = s->second.tools.find(tool);
    if (t == s->second.tools.end()) return nullptr;
    return &t->second;
}

SessionAggregate::SessionAggregate(std::string platform, std::string project, size_t call_history_limit)
    : platform_(std::move(platform))
    , project_(std::move(project))
    , start_time_(std::chrono::system_clock::now())
    , call_history_limit_(call_history_limit)
{
}

bool SessionAggregate::apply(const CanonicalEvent& event) {
    if (finalized_) {
        return false;
    }
    if (const auto* delta = std::get_if<SessionTokenDelta>(&event)) {
        return apply_delta(*delta);
    }
    return apply_tool_call(std::get<ToolCallEvent>(event));
}

bool SessionAggregate::apply_delta(const SessionTokenDelta& delta) {
    tokens_.add(delta.tokens);
    return true;
}

bool SessionAggregate::apply_tool_call(const ToolCallEvent& call) {
    auto name = split_mcp_tool_name(call.tool_name);
    if (!name) {
        return false;
    }

    uint64_t call_tokens = call.tokens.total();

    ServerSession& server = servers_[name->server];
    auto [tool_it, inserted] = server.tools.try_emplace(name->tool);
    ToolStats& stats = tool_it->second;

    stats.calls += 1;
    stats.total_tokens += call_tokens;
    stats.avg_tokens = static_cast<double>(stats.total_tokens) / static_cast<double>(stats.calls);

    CallRecord record;
    record.timestamp = call.timestamp;
    record.total_tokens = call_tokens;
    record.input_tokens = call.tokens.input_tokens;
    record.output_tokens = call.tokens.output_tokens;
    record.cache_created_tokens = call.tokens.cache_created_tokens;
    record.cache_read_tokens = call.tokens.cache_read_tokens;
    record.duration_ms = call.duration_ms;
    record.success = call.success;
    record.call_id = call.call_id;
    record.content_signature = call.content_signature;
    stats.call_history.push_back(std::move(record));
    while (stats.call_history.size() > call_history_limit_) {
        stats.call_history.pop_front();
    }

    server.total_calls += 1;
    server.total_tokens += call_tokens;
    total_calls_ += 1;
    if (inserted) {
        unique_tools_ += 1;
    }
    return true;
}

void SessionAggregate::set_context(const std::string& model, const std::string& working_directory) {
    if (finalized_) return;
    if (model_.empty() && !model.empty()) {
        model_ = model;
    }
    if (!working_directory.empty()) {
        working_directory_ = working_directory;
    }
}

void SessionAggregate::add_source_file(const std::string& path) {
    if (finalized_) return;
    if (std::find(source_files_.begin(), source_files_.end(), path) == source_files_.end()) {
        source_files_.push_back(path);
    }
}

void SessionAggregate::count_message() {
    if (finalized_) return;
    message_count_ += 1;
}

void SessionAggregate::set_platform_data(const nlohmann::json& data) {
    if (finalized_) return;
    platform_data_ = data.is_object() ? data : nlohmann::json::object();
}

bool SessionAggregate::has_data() const {
    return tokens_.total_tokens > 0 || total_calls_ > 0;
}

SessionSnapshot SessionAggregate::snapshot() const {
    SessionSnapshot s;
    s.platform = platform_;
    s.project = project_;
    s.model = model_;
    s.working_directory = working_directory_;
    s.start_time = start_time_;
    s.end_time = end_time_;
    Timestamp until = end_time_ ? *end_time_ : std::chrono::system_clock::now();
    s.duration_seconds = std::max(0.0, seconds_between(start_time_, until));
    s.message_count = message_count_;
    s.source_files = source_files_;
    s.token_usage = tokens_;
    s.mcp_summary.total_calls = total_calls_;
    s.mcp_summary.unique_tools = unique_tools_;
    for (const auto& [name, server] : servers_) {
        s.mcp_summary.total_tokens += server.total_tokens;
    }
    s.server_sessions = servers_;
    s.platform_data = platform_data_;
    return s;
}

std::optional<SessionSnapshot> SessionAggregate::finalize(Timestamp end_time) {
    if (finalized_) {
        return final_snapshot_;
    }
    finalized_ = true;
    end_time_ = end_time;
    if (has_data()) {
        final_snapshot_ = snapshot();
    }
    return final_snapshot_;
}

}
