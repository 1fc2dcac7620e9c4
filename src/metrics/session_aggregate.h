#pragma once

#include "core/canonical_event.h"
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpaudit {

struct TokenTotals {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_created_tokens = 0;
    uint64_t cache_read_tokens = 0;
    uint64_t total_tokens = 0;
    double cache_efficiency = 0.0;

    void add(const TokenCounts& delta);

    // Derives total_tokens and cache_efficiency from the four buckets.
    void recompute();
};

struct CallRecord {
    std::optional<Timestamp> timestamp;
    uint64_t total_tokens = 0;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_created_tokens = 0;
    uint64_t cache_read_tokens = 0;
    std::optional<uint64_t> duration_ms;
    std::optional<bool> success;
    std::string call_id;
    std::optional<std::string> content_signature;
};

struct ToolStats {
    uint64_t calls = 0;
    uint64_t total_tokens = 0;
    double avg_tokens = 0.0;
    std::deque<CallRecord> call_history;  // most recent last
};

struct ServerSession {
    uint64_t total_calls = 0;
    uint64_t total_tokens = 0;
    std::map<std::string, ToolStats> tools;
};

struct McpSummary {
    uint64_t total_calls = 0;
    uint64_t unique_tools = 0;
    uint64_t total_tokens = 0;
};

struct SessionSnapshot {
    std::string platform;
    std::string project;
    std::string model;
    std::string working_directory;
    Timestamp start_time{};
    std::optional<Timestamp> end_time;
    double duration_seconds = 0.0;
    uint64_t message_count = 0;
    std::vector<std::string> source_files;

    TokenTotals token_usage;
    McpSummary mcp_summary;
    std::map<std::string, ServerSession> server_sessions;
    nlohmann::json platform_data = nlohmann::json::object();

    const ToolStats* find_tool(const std::string& server, const std::string& tool) const;
};

void to_json(nlohmann::json& j, const TokenTotals& t);
void from_json(const nlohmann::json& j, TokenTotals& t);
void to_json(nlohmann::json& j, const CallRecord& r);
void from_json(const nlohmann::json& j, CallRecord& r);
void to_json(nlohmann::json& j, const SessionSnapshot& s);
void from_json(const nlohmann::json& j, SessionSnapshot& s);

// The single mutable accumulator of a tracked session. Canonical events are
// applied in arrival order; each apply either fully succeeds or changes
// nothing.
class SessionAggregate {
public:
    static constexpr size_t kDefaultCallHistoryLimit = 1000;

    SessionAggregate(std::string platform, std::string project,
                     size_t call_history_limit = kDefaultCallHistoryLimit);

    bool apply(const CanonicalEvent& event);

    // Freezes the aggregate. Returns nullopt when nothing was tracked.
    // Further calls return the same result.
    std::optional<SessionSnapshot> finalize(Timestamp end_time);

    void set_start_time(Timestamp start) { start_time_ = start; }
    // Model is latched: once set it is never replaced.
    void set_context(const std::string& model, const std::string& working_directory);
    void add_source_file(const std::string& path);
    void count_message();
    void set_platform_data(const nlohmann::json& data);

    bool has_data() const;
    bool is_finalized() const { return finalized_; }

    // Active representation, end_time unset until finalized.
    SessionSnapshot snapshot() const;

    const TokenTotals& token_usage() const { return tokens_; }
    uint64_t total_calls() const { return total_calls_; }
    uint64_t unique_tools() const { return unique_tools_; }
    uint64_t message_count() const { return message_count_; }
    const std::map<std::string, ServerSession>& server_sessions() const { return servers_; }
    const std::string& model() const { return model_; }
    const std::string& platform() const { return platform_; }
    const std::string& project() const { return project_; }
    Timestamp start_time() const { return start_time_; }

private:
    bool apply_delta(const SessionTokenDelta& delta);
    bool apply_tool_call(const ToolCallEvent& call);

    std::string platform_;
    std::string project_;
    std::string model_;
    std::string working_directory_;
    Timestamp start_time_;
    std::optional<Timestamp> end_time_;
    size_t call_history_limit_;

    TokenTotals tokens_;
    uint64_t total_calls_ = 0;
    uint64_t unique_tools_ = 0;
    uint64_t message_count_ = 0;
    std::map<std::string, ServerSession> servers_;
    std::vector<std::string> source_files_;
    nlohmann::json platform_data_ = nlohmann::json::object();

    bool finalized_ = false;
    std::optional<SessionSnapshot> final_snapshot_;
};

}
