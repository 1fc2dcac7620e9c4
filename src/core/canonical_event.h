#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpaudit {

using Timestamp = std::chrono::system_clock::time_point;

// Tool name reserved for pure token deltas with no tool call attached.
inline constexpr const char* kSessionSentinel = "__session__";
inline constexpr const char* kMcpPrefix = "mcp__";

struct TokenCounts {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_created_tokens = 0;
    uint64_t cache_read_tokens = 0;

    uint64_t total() const {
        return input_tokens + output_tokens + cache_created_tokens + cache_read_tokens;
    }
};

struct SessionTokenDelta {
    TokenCounts tokens;
    std::optional<Timestamp> timestamp;
};

struct ToolCallEvent {
    std::string tool_name;
    std::string server;
    std::optional<Timestamp> timestamp;
    std::optional<uint64_t> duration_ms;
    std::optional<bool> success;
    nlohmann::json parameters = nlohmann::json::object();
    std::optional<std::string> content_signature;
    std::string call_id;
    TokenCounts tokens;
};

using CanonicalEvent = std::variant<SessionTokenDelta, ToolCallEvent>;

struct McpToolName {
    std::string server;
    std::string tool;
};

// Splits "mcp__<server>__<tool>". Returns nullopt for built-in tools and
// malformed names (missing prefix, empty server or tool segment).
std::optional<McpToolName> split_mcp_tool_name(const std::string& tool_name);

inline bool is_mcp_tool_name(const std::string& tool_name) {
    return split_mcp_tool_name(tool_name).has_value();
}

// Returns kSessionSentinel for token deltas.
std::string event_tool_name(const CanonicalEvent& event);

// Deterministic signature of a tool call's arguments: identical logical
// arguments always produce the same 16-digit hex string.
std::string compute_content_signature(const nlohmann::json& parameters);

ToolCallEvent make_tool_call_event(const std::string& tool_name, const nlohmann::json& parameters);

}
